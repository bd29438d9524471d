#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/history/result.hpp"
#include "internal/util/time.hpp"

namespace chatrelay::history {

struct HistoryMessage {
  std::string     message_id;
  std::string     chat_id;
  std::string     sender;
  std::string     content;
  util::TimePoint timestamp{};
  bool            is_from_me = false;

  std::string media_type;
  std::string filename;
  std::string url;
};

struct ChatRecord {
  std::string     chat_id;
  std::string     name;
  util::TimePoint last_message_time{};
};

/*
  Durable message history, keyed by (message_id, chat_id).

  StoreMessage replaces an existing row with the same key and makes sure
  the chat row exists.
*/
class HistoryStore {
 public:
  virtual ~HistoryStore() = default;

  virtual Result StoreMessage(const HistoryMessage& message) = 0;

  // Sets the name when non-empty and moves last_message_time forward.
  virtual Result UpsertChat(const std::string& chat_id, const std::string& name, util::TimePoint last_message_time) = 0;

  virtual std::optional<ChatRecord> GetChat(const std::string& chat_id) = 0;

  // Newest `limit` messages of the chat, oldest first.
  virtual std::vector<HistoryMessage> RecentMessages(const std::string& chat_id, int limit) = 0;
};

} // namespace chatrelay::history
