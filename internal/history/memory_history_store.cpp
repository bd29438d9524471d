#include "memory_history_store.hpp"

#include <algorithm>
#include <vector>

namespace chatrelay::history {

Result MemoryHistoryStore::StoreMessage(const HistoryMessage& message) {
  if (message.message_id.empty() || message.chat_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "message id and chat id are required");
  }

  std::lock_guard lock(mutex_);
  chats_.try_emplace(message.chat_id, ChatRecord{message.chat_id, {}, {}});
  messages_[{message.chat_id, message.message_id}] = {++sequence_, message};
  return Result::Ok();
}

Result MemoryHistoryStore::UpsertChat(const std::string& chat_id, const std::string& name, util::TimePoint last_message_time) {
  std::lock_guard lock(mutex_);
  auto&           chat = chats_[chat_id];
  chat.chat_id         = chat_id;
  if (!name.empty()) chat.name = name;
  chat.last_message_time = std::max(chat.last_message_time, last_message_time);
  return Result::Ok();
}

std::optional<ChatRecord> MemoryHistoryStore::GetChat(const std::string& chat_id) {
  std::lock_guard lock(mutex_);
  auto            it = chats_.find(chat_id);
  if (it == chats_.end()) return std::nullopt;
  return it->second;
}

std::vector<HistoryMessage> MemoryHistoryStore::RecentMessages(const std::string& chat_id, int limit) {
  std::vector<std::pair<std::uint64_t, HistoryMessage>> rows;
  {
    std::lock_guard lock(mutex_);
    for (auto it = messages_.lower_bound({chat_id, std::string()}); it != messages_.end() && it->first.first == chat_id; ++it) {
      rows.push_back(it->second);
    }
  }

  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.second.timestamp != b.second.timestamp) return a.second.timestamp < b.second.timestamp;
    return a.first < b.first;
  });

  const auto skip = limit >= 0 && rows.size() > static_cast<std::size_t>(limit) ? rows.size() - static_cast<std::size_t>(limit) : 0;

  std::vector<HistoryMessage> out;
  for (std::size_t i = skip; i < rows.size(); ++i) out.push_back(std::move(rows[i].second));
  return out;
}

} // namespace chatrelay::history
