#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "internal/model/envelope.hpp"
#include "internal/util/keyed_mutex.hpp"

namespace chatrelay::sink {

inline constexpr std::string_view kContacts = "contacts";
inline constexpr std::string_view kGroups   = "groups";
inline constexpr std::string_view kDevices  = "devices";
inline constexpr std::string_view kSystem   = "system";

struct Partition {
  std::string category;
  std::string key; // sanitized
};

// <base>/<category>/<sanitized key>.ndjson
std::filesystem::path PartitionPath(const std::filesystem::path& base, std::string_view category, std::string_view key);

// Category and key for an envelope; device events use `host_id`.
Partition Classify(const model::Envelope& env, std::string_view host_id);

// Name of the local host, "unknown" when unavailable.
std::string LocalHostId();

struct FolderSinkOptions {
  std::filesystem::path base_dir = "outbox";

  // Rotation ceiling in bytes; non-positive disables rotation.
  std::int64_t max_bytes = 10 * 1024 * 1024;

  // Partition key for device events; LocalHostId() when empty.
  std::string host_id;
};

/*
  Append-only NDJSON writer partitioned by conversation.

  Rotation keeps writing to the highest existing part of a partition
  (<file>, <file>.part1, <file>.part2, ...) and moves to the next part only
  when the current one is non-empty and the line would push it over the
  ceiling. Existing parts are never overwritten. Writes to one file are
  serialized by a per-path lock.
*/
class FolderSink {
 public:
  explicit FolderSink(FolderSinkOptions options);

  // Stamps `at` when unset. Returns the file written. Throws util::PersistenceError.
  std::filesystem::path Append(model::Envelope env);

  std::filesystem::path TargetFor(const model::Envelope& env) const;

  const FolderSinkOptions& Options() const {
    return options_;
  }

  // Paths with a write in progress or waiting.
  std::size_t LockedPaths() const {
    return locks_.Size();
  }

 private:

  // Requires the path lock.
  std::filesystem::path CurrentPart(const std::filesystem::path& base, std::uintmax_t incoming) const;

  FolderSinkOptions options_;

  util::KeyedMutex locks_;
};

} // namespace chatrelay::sink
