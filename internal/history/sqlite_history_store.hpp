#pragma once

#include <memory>
#include <string>

#include "internal/history/history_store.hpp"
#include "internal/history/sqlite_db.hpp"

namespace chatrelay::history {

/*
  SQLite-backed history. Creates the chats/messages schema on open.

  Throws std::runtime_error from the constructor when the database cannot
  be opened or migrated.
*/
class SqliteHistoryStore : public HistoryStore {
 public:
  explicit SqliteHistoryStore(const std::string& path);

  Result                      StoreMessage(const HistoryMessage& message) override;
  Result                      UpsertChat(const std::string& chat_id, const std::string& name, util::TimePoint last_message_time) override;
  std::optional<ChatRecord>   GetChat(const std::string& chat_id) override;
  std::vector<HistoryMessage> RecentMessages(const std::string& chat_id, int limit) override;

 private:
  void Bootstrap();

  std::unique_ptr<SqliteDB> db_;
};

} // namespace chatrelay::history
