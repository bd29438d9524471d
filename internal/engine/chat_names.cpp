#include "chat_names.hpp"

#include "internal/identity/chat_id.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::engine {

namespace {

std::string Trimmed(std::string_view s) {
  return std::string(util::Trim(s));
}

std::string DisplayName(const ChatNameInput& in) {
  return in.event ? Trimmed(in.event->conversation_display_name()) : std::string();
}

std::string ConversationName(const ChatNameInput& in) {
  return in.event ? Trimmed(in.event->conversation_name()) : std::string();
}

std::string GroupDirectory(const ChatNameInput& in) {
  return in.names ? Trimmed(in.names->GroupName(in.chat_id)) : std::string();
}

std::string GroupFallback(const ChatNameInput& in) {
  return "Group " + identity::UserPart(in.chat_id);
}

std::string ContactDirectory(const ChatNameInput& in) {
  return in.names ? Trimmed(in.names->ContactName(in.chat_id)) : std::string();
}

// own push name is not the contact's
std::string PushName(const ChatNameInput& in) {
  if (!in.event || in.event->info().is_from_me()) return {};
  return Trimmed(in.event->info().push_name());
}

std::string AddressUser(const ChatNameInput& in) {
  return identity::UserPart(in.chat_id.empty() ? in.sender_id : in.chat_id);
}

} // namespace

const std::vector<ChatNameStrategy>& GroupNameStrategies() {
  static const std::vector<ChatNameStrategy> kStrategies = {
      {"display_name", DisplayName},
      {"conversation_name", ConversationName},
      {"group_directory", GroupDirectory},
      {"group_fallback", GroupFallback},
  };
  return kStrategies;
}

const std::vector<ChatNameStrategy>& ContactNameStrategies() {
  static const std::vector<ChatNameStrategy> kStrategies = {
      {"contact_directory", ContactDirectory},
      {"push_name", PushName},
      {"address_user", AddressUser},
  };
  return kStrategies;
}

std::string ResolveChatName(const ChatNameInput& input) {
  const auto& strategies = identity::IsGroup(input.chat_id) ? GroupNameStrategies() : ContactNameStrategies();
  for (const auto& strategy : strategies) {
    if (auto name = strategy.resolve(input); !name.empty()) return name;
  }
  return {};
}

} // namespace chatrelay::engine
