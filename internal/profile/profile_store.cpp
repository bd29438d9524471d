#include "profile_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/identity/chat_id.hpp"
#include "internal/model/json.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sink/folder_sink.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::profile {

namespace fs = std::filesystem;

using observability::StringField;

int NextStreak(const std::string& last_day, int streak, const std::string& today) {
  if (last_day == today) return streak;
  if (!last_day.empty() && util::PreviousDay(today) == last_day) return streak + 1;
  return 1;
}

ProfileStore::ProfileStore(ProfileStoreOptions options) : options_(std::move(options)) {
}

fs::path ProfileStore::SnapshotPath(const std::string& chat_id) const {
  return options_.base_dir / "profiles" / (identity::SanitizeKey(chat_id) + ".json");
}

std::optional<Profile> ProfileStore::Load(const std::string& chat_id) const {
  const auto    path = SnapshotPath(chat_id);
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;

  std::stringstream buffer;
  buffer << in.rdbuf();

  Profile profile;
  try {
    model::FromJson(buffer.str(), &profile);
  } catch (const util::ValidationError& e) {
    CHATRELAY_LOG_WARN("profile_snapshot_unreadable", {StringField("path", path.string()), StringField("error", e.what())});
    return std::nullopt;
  }
  return profile;
}

void ProfileStore::Persist(Entry& entry, const Profile& copy, std::uint64_t version) const {
  std::lock_guard lock(entry.io_mutex);
  if (version <= entry.written) return;
  WriteSnapshot(copy);
  entry.written = version;
}

void ProfileStore::WriteSnapshot(const Profile& profile) const {
  const auto path = SnapshotPath(profile.chat_id());
  auto       tmp  = path;
  tmp += ".tmp";

  try {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) throw util::PersistenceError("create " + path.parent_path().string() + ": " + ec.message());

    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) throw util::PersistenceError("open " + tmp.string());
      out << model::ToJson(profile, true);
      out.flush();
      if (!out) throw util::PersistenceError("write " + tmp.string());
    }

    fs::rename(tmp, path, ec);
    if (ec) throw util::PersistenceError("rename " + tmp.string() + ": " + ec.message());
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR("profile_persist_failed", {StringField("chat", profile.chat_id()), StringField("error", e.what())});
  }
}

std::shared_ptr<ProfileStore::Entry> ProfileStore::Find(const std::string& chat_id) const {
  std::lock_guard lock(mutex_);
  auto            it = profiles_.find(chat_id);
  if (it == profiles_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<ProfileStore::Entry> ProfileStore::Acquire(const std::string& chat_id, util::TimePoint now) {
  if (auto entry = Find(chat_id)) return entry;

  // disk read happens outside the map lock
  auto entry = std::make_shared<Entry>();
  if (auto loaded = Load(chat_id)) {
    entry->profile = std::move(*loaded);
    entry->profile.set_chat_id(chat_id);
  } else {
    auto& p = entry->profile;
    p.set_chat_id(chat_id);
    p.set_language(options_.default_language);
    p.set_tier(options_.default_tier);
    *p.mutable_first_seen()      = util::ToProto(now);
    *p.mutable_last_connection() = util::ToProto(now);
  }

  std::lock_guard lock(mutex_);
  auto [it, inserted] = profiles_.try_emplace(chat_id, entry);
  return it->second;
}

Profile ProfileStore::TouchInbound(const model::Envelope& env, util::TimePoint now) {
  std::string key(util::Trim(env.chat_id()));
  if (key.empty()) key = std::string(util::Trim(env.sender_id()));
  if (key.empty()) throw util::ValidationError("profile: envelope has neither chat nor sender");

  auto          entry = Acquire(key, now);
  Profile       copy;
  std::uint64_t version = 0;
  {
    std::lock_guard lock(entry->mutex);
    auto&           p = entry->profile;

    if (!env.chat_name().empty()) p.set_name(env.chat_name());
    *p.mutable_last_connection() = util::ToProto(now);
    p.set_last_chat(env.chat_id());
    p.set_last_text(env.text());

    auto* metrics = p.mutable_metrics();
    metrics->set_msg_in(metrics->msg_in() + 1);
    *metrics->mutable_last_msg_at() = util::ToProto(now);
    metrics->set_last_msg_id(env.message_id());

    const auto today = util::LocalDay(now);
    metrics->set_streak_days(NextStreak(metrics->streak_last_day(), metrics->streak_days(), today));
    metrics->set_streak_last_day(today);

    const std::string& chat = env.chat_id();
    if (!chat.empty()) {
      auto& tags = *p.mutable_tags();
      if (identity::IsGroup(chat)) {
        tags["out.group." + chat] = sink::PartitionPath(options_.base_dir, sink::kGroups, chat).string();
      } else {
        tags["out.contacts_ndjson"] = sink::PartitionPath(options_.base_dir, sink::kContacts, chat).string();
      }
    }

    copy    = p;
    version = ++entry->version;
  }

  Persist(*entry, copy, version);
  return copy;
}

Profile ProfileStore::RecordOutbound(const std::string& chat_id, util::TimePoint now) {
  if (chat_id.empty()) throw util::ValidationError("profile: empty chat id");

  auto          entry = Acquire(chat_id, now);
  Profile       copy;
  std::uint64_t version = 0;
  {
    std::lock_guard lock(entry->mutex);
    auto*           metrics = entry->profile.mutable_metrics();
    metrics->set_msg_out(metrics->msg_out() + 1);
    *metrics->mutable_last_msg_at() = util::ToProto(now);
    copy                            = entry->profile;
    version                         = ++entry->version;
  }

  Persist(*entry, copy, version);
  return copy;
}

std::optional<Profile> ProfileStore::AppendMedia(const std::string& chat_id, const model::Envelope& env) {
  return AppendMedia(chat_id, env, options_.media_history_cap);
}

std::optional<Profile> ProfileStore::AppendMedia(const std::string& chat_id, const model::Envelope& env, std::size_t cap) {
  if (util::Trim(chat_id).empty() || !env.has_media()) return std::nullopt;

  const std::string type = util::ToLower(util::Trim(env.media().type()));
  if (type.empty()) return std::nullopt;

  const auto now = util::Now();

  model::MediaTicket ticket = env.media();
  ticket.set_type(type);
  ticket.set_direction(util::ToLower(util::Trim(env.direction())));
  ticket.set_chat_id(chat_id);
  ticket.set_sender_id(env.sender_id());
  ticket.set_message_id(env.message_id());
  if (ticket.caption().empty()) ticket.set_caption(std::string(util::Trim(env.text())));
  if (!ticket.has_at()) *ticket.mutable_at() = env.has_at() ? env.at() : util::ToProto(now);

  auto          entry = Acquire(chat_id, now);
  Profile       copy;
  std::uint64_t version = 0;
  {
    std::lock_guard lock(entry->mutex);
    auto*           media = entry->profile.mutable_media();
    auto*           list  = model::IsOutbound(env) ? media->mutable_outbound() : media->mutable_inbound();

    *list->Add() = std::move(ticket);
    if (cap > 0 && static_cast<std::size_t>(list->size()) > cap) {
      list->DeleteSubrange(0, list->size() - static_cast<int>(cap));
    }
    copy    = entry->profile;
    version = ++entry->version;
  }

  Persist(*entry, copy, version);
  return copy;
}

std::optional<Profile> ProfileStore::Get(const std::string& chat_id) {
  auto entry = Find(chat_id);
  if (!entry) {
    auto loaded = Load(chat_id);
    if (!loaded) return std::nullopt;
    entry = Acquire(chat_id, util::Now());
  }

  std::lock_guard lock(entry->mutex);
  return entry->profile;
}

std::vector<Profile> ProfileStore::Snapshot() const {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::lock_guard lock(mutex_);
    entries.reserve(profiles_.size());
    for (const auto& [key, entry] : profiles_) entries.push_back(entry);
  }

  std::vector<Profile> out;
  out.reserve(entries.size());
  for (const auto& entry : entries) {
    std::lock_guard lock(entry->mutex);
    out.push_back(entry->profile);
  }
  return out;
}

} // namespace chatrelay::profile
