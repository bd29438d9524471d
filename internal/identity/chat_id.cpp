#include "chat_id.hpp"

#include "internal/util/text.hpp"

namespace chatrelay::identity {

namespace {

// user.agent:device -> user
std::string_view StripDevice(std::string_view user) {
  const auto cut = user.find_first_of(".:");
  if (cut != std::string_view::npos) user = user.substr(0, cut);
  return user;
}

} // namespace

std::string CanonicalChatId(std::string_view raw) {
  raw = util::Trim(raw);
  if (raw.empty()) return {};
  if (raw == kStatusBroadcast) return std::string(raw);

  const auto at = raw.find('@');
  if (at == std::string_view::npos) {
    auto user = StripDevice(raw);
    if (!user.empty() && user.front() == '+') user.remove_prefix(1);
    if (user.empty()) return {};
    return std::string(user) + "@" + std::string(kUserServer);
  }

  auto        user   = StripDevice(raw.substr(0, at));
  std::string server = util::ToLower(raw.substr(at + 1));
  if (server == kLidServer) server = std::string(kUserServer);
  if (server == kUserServer && !user.empty() && user.front() == '+') user.remove_prefix(1);

  return std::string(user) + "@" + server;
}

bool IsGroup(std::string_view id) {
  return id.size() >= kGroupServer.size() && id.substr(id.size() - kGroupServer.size()) == kGroupServer;
}

bool IsStatusBroadcast(std::string_view id) {
  return id == kStatusBroadcast;
}

std::string UserPart(std::string_view id) {
  const auto at = id.find('@');
  return std::string(at == std::string_view::npos ? id : id.substr(0, at));
}

std::string SanitizeKey(std::string_view key) {
  key = util::Trim(key);

  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    // one replacement per UTF-8 code point
    if ((static_cast<unsigned char>(c) & 0xC0) == 0x80) continue;
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    out.push_back(keep ? c : '_');
  }
  if (out.empty()) return "unknown";
  return out;
}

} // namespace chatrelay::identity
