#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chatrelay/v1.hpp"
#include "internal/model/envelope.hpp"
#include "internal/util/time.hpp"

namespace chatrelay::profile {

using Profile = chatrelay::v1::Profile;

struct ProfileStoreOptions {
  // Snapshots go to <base_dir>/profiles/<sanitized chat id>.json.
  std::filesystem::path base_dir = "outbox";

  std::size_t media_history_cap = 200;

  std::string default_language = "es";
  std::string default_tier     = "free";
};

// Streak after a message on `today` given the stored day and streak.
int NextStreak(const std::string& last_day, int streak, const std::string& today);

/*
  One aggregate record per canonical chat id.

  A chat not resident in memory is rehydrated from its snapshot before a
  fresh record is created. Mutations of one chat are serialized; each one
  copies the record under the chat lock and writes the snapshot outside
  it (temporary file, then rename). Snapshot failures are logged and the
  in-memory record stays authoritative.
*/
class ProfileStore {
 public:
  explicit ProfileStore(ProfileStoreOptions options);

  // Inbound message bookkeeping: counters, streak, last text, sink paths.
  Profile TouchInbound(const model::Envelope& env, util::TimePoint now);

  Profile RecordOutbound(const std::string& chat_id, util::TimePoint now);

  // Adds env.media() to the history list of env's direction, keeping the newest `cap`.
  std::optional<Profile> AppendMedia(const std::string& chat_id, const model::Envelope& env, std::size_t cap);
  std::optional<Profile> AppendMedia(const std::string& chat_id, const model::Envelope& env);

  std::optional<Profile> Get(const std::string& chat_id);

  // All resident profiles.
  std::vector<Profile> Snapshot() const;

  std::filesystem::path SnapshotPath(const std::string& chat_id) const;

 private:
  struct Entry {
    std::mutex    mutex;
    Profile       profile;
    std::uint64_t version = 0;

    // Orders snapshot writes; a stale copy never replaces a newer one.
    std::mutex    io_mutex;
    std::uint64_t written = 0;
  };

  std::shared_ptr<Entry> Acquire(const std::string& chat_id, util::TimePoint now);
  std::shared_ptr<Entry> Find(const std::string& chat_id) const;

  std::optional<Profile> Load(const std::string& chat_id) const;
  void                   Persist(Entry& entry, const Profile& copy, std::uint64_t version) const;
  void                   WriteSnapshot(const Profile& profile) const;

  ProfileStoreOptions options_;

  mutable std::mutex                                      mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> profiles_;
};

} // namespace chatrelay::profile
