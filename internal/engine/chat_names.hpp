#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/protocol/protocol_client.hpp"

namespace chatrelay::engine {

struct ChatNameInput {
  const chatrelay::protocol::v1::MessageEvent* event = nullptr; // may be null for outbound
  const protocol::NameDirectory*               names = nullptr; // may be null

  std::string chat_id;   // canonical
  std::string sender_id; // canonical
};

/*
  One named way of deriving a chat name. Strategies are pure and return
  empty when they have nothing to offer.
*/
struct ChatNameStrategy {
  std::string_view                                name;
  std::function<std::string(const ChatNameInput&)> resolve;
};

// display name, conversation name, group directory, "Group <user>"
const std::vector<ChatNameStrategy>& GroupNameStrategies();

// contact directory, sender push name, address user part
const std::vector<ChatNameStrategy>& ContactNameStrategies();

// First non-empty result of the strategy list matching the chat kind.
std::string ResolveChatName(const ChatNameInput& input);

} // namespace chatrelay::engine
