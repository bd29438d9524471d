#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/history/history_store.hpp"

namespace chatrelay::history {

/*
  In-memory history with the same semantics as the SQLite store.
*/
class MemoryHistoryStore : public HistoryStore {
 public:
  Result                      StoreMessage(const HistoryMessage& message) override;
  Result                      UpsertChat(const std::string& chat_id, const std::string& name, util::TimePoint last_message_time) override;
  std::optional<ChatRecord>   GetChat(const std::string& chat_id) override;
  std::vector<HistoryMessage> RecentMessages(const std::string& chat_id, int limit) override;

 private:
  std::mutex mutex_;

  std::map<std::string, ChatRecord> chats_;

  // (chat_id, message_id) -> row, plus insertion sequence for stable ordering
  std::map<std::pair<std::string, std::string>, std::pair<std::uint64_t, HistoryMessage>> messages_;
  std::uint64_t                                                                           sequence_ = 0;
};

} // namespace chatrelay::history
