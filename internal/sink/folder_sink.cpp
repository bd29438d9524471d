#include "folder_sink.hpp"

#include <unistd.h>

#include <fstream>
#include <system_error>

#include "internal/identity/chat_id.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::sink {

namespace fs = std::filesystem;

fs::path PartitionPath(const fs::path& base, std::string_view category, std::string_view key) {
  return base / std::string(category) / (identity::SanitizeKey(key) + ".ndjson");
}

Partition Classify(const model::Envelope& env, std::string_view host_id) {
  const std::string_view chat = util::Trim(env.chat_id());

  if (!chat.empty() && identity::IsGroup(chat)) {
    return {std::string(kGroups), identity::SanitizeKey(chat)};
  }
  if (identity::IsStatusBroadcast(chat) && !util::Trim(env.sender_id()).empty()) {
    return {std::string(kContacts), identity::SanitizeKey(env.sender_id())};
  }
  if (!chat.empty()) {
    return {std::string(kContacts), identity::SanitizeKey(chat)};
  }
  if (model::IsDeviceEvent(env.event_type())) {
    return {std::string(kDevices), identity::SanitizeKey(host_id)};
  }
  return {std::string(kSystem), identity::SanitizeKey(env.event_type())};
}

std::string LocalHostId() {
  char buf[256] = {};
  if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') return "unknown";
  return buf;
}

FolderSink::FolderSink(FolderSinkOptions options) : options_(std::move(options)) {
  if (options_.host_id.empty()) options_.host_id = LocalHostId();
}

fs::path FolderSink::TargetFor(const model::Envelope& env) const {
  const auto partition = Classify(env, options_.host_id);
  return options_.base_dir / partition.category / (partition.key + ".ndjson");
}

fs::path FolderSink::CurrentPart(const fs::path& base, std::uintmax_t incoming) const {
  std::error_code ec;

  int      index   = 0;
  fs::path current = base;
  for (;;) {
    fs::path next = base;
    next += ".part" + std::to_string(index + 1);
    if (!fs::exists(next, ec)) break;
    current = next;
    ++index;
  }

  if (options_.max_bytes <= 0) return current;

  const auto size = fs::exists(current, ec) ? fs::file_size(current, ec) : 0;
  if (ec || size == 0) return current;
  if (size + incoming <= static_cast<std::uintmax_t>(options_.max_bytes)) return current;

  fs::path next = base;
  next += ".part" + std::to_string(index + 1);
  return next;
}

fs::path FolderSink::Append(model::Envelope env) {
  model::StampIfUnset(env, util::Now());

  std::string line = model::Serialize(env);
  line.push_back('\n');

  const auto base = TargetFor(env);
  auto       lock = locks_.Lock(base.string());

  std::error_code ec;
  fs::create_directories(base.parent_path(), ec);
  if (ec) {
    throw util::PersistenceError("sink: create " + base.parent_path().string() + ": " + ec.message());
  }

  const auto    target = CurrentPart(base, line.size());
  std::ofstream out(target, std::ios::binary | std::ios::app);
  if (!out) {
    throw util::PersistenceError("sink: open " + target.string());
  }
  out.write(line.data(), static_cast<std::streamsize>(line.size()));
  out.flush();
  if (!out) {
    throw util::PersistenceError("sink: write " + target.string());
  }
  return target;
}

} // namespace chatrelay::sink
