#include "sqlite_history_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace chatrelay::history {

namespace {

Result FromSqlite(int rc, sqlite3* db) {
  switch (rc) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return Result::Ok();
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
  sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

// NULL for empty optional columns
void BindOptionalText(sqlite3_stmt* stmt, int index, const std::string& value) {
  if (value.empty()) {
    sqlite3_bind_null(stmt, index);
  } else {
    BindText(stmt, index, value);
  }
}

std::string ColumnText(sqlite3_stmt* stmt, int index) {
  const auto* text = sqlite3_column_text(stmt, index);
  if (!text) return {};
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

util::TimePoint FromMillis(sqlite3_int64 ms) {
  return util::TimePoint{} + std::chrono::milliseconds(ms);
}

} // namespace

SqliteHistoryStore::SqliteHistoryStore(const std::string& path) : db_(std::make_unique<SqliteDB>(path)) {
  Bootstrap();
}

void SqliteHistoryStore::Bootstrap() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS chats (jid TEXT PRIMARY KEY, name TEXT, last_message_time INTEGER);",
      "CREATE TABLE IF NOT EXISTS messages (id TEXT NOT NULL, chat_jid TEXT NOT NULL, sender TEXT, content TEXT, timestamp INTEGER NOT NULL, is_from_me INTEGER NOT NULL, "
      "media_type TEXT, filename TEXT, url TEXT, media_key BLOB, file_sha256 BLOB, file_enc_sha256 BLOB, file_length INTEGER, "
      "PRIMARY KEY (id, chat_jid), FOREIGN KEY (chat_jid) REFERENCES chats(jid));",
      "CREATE INDEX IF NOT EXISTS messages_chat_ts ON messages (chat_jid, timestamp);"};

  for (const auto& sql : kBootstrapSql) {
    db_->Exec(sql);
  }

  db_->Exec("SELECT jid,name,last_message_time FROM chats LIMIT 1;");
  db_->Exec("SELECT id,chat_jid,sender,content,timestamp,is_from_me,media_type,filename,url FROM messages LIMIT 1;");
}

Result SqliteHistoryStore::StoreMessage(const HistoryMessage& message) {
  if (message.message_id.empty() || message.chat_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "message id and chat id are required");
  }

  try {
    auto chat = Prepare(*db_, "INSERT OR IGNORE INTO chats (jid) VALUES (?);");
    BindText(chat.get(), 1, message.chat_id);
    if (auto rc = sqlite3_step(chat.get()); rc != SQLITE_DONE) return FromSqlite(rc, db_->Handle());

    auto stmt = Prepare(*db_,
                        "INSERT OR REPLACE INTO messages (id, chat_jid, sender, content, timestamp, is_from_me, media_type, filename, url) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    BindText(stmt.get(), 1, message.message_id);
    BindText(stmt.get(), 2, message.chat_id);
    BindText(stmt.get(), 3, message.sender);
    BindText(stmt.get(), 4, message.content);
    sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(util::ToUnixMillis(message.timestamp)));
    sqlite3_bind_int(stmt.get(), 6, message.is_from_me ? 1 : 0);
    BindOptionalText(stmt.get(), 7, message.media_type);
    BindOptionalText(stmt.get(), 8, message.filename);
    BindOptionalText(stmt.get(), 9, message.url);

    return FromSqlite(sqlite3_step(stmt.get()), db_->Handle());
  } catch (const std::runtime_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

Result SqliteHistoryStore::UpsertChat(const std::string& chat_id, const std::string& name, util::TimePoint last_message_time) {
  try {
    auto stmt = Prepare(*db_,
                        "INSERT INTO chats (jid, name, last_message_time) VALUES (?1, NULLIF(?2, ''), ?3) "
                        "ON CONFLICT(jid) DO UPDATE SET "
                        "name = COALESCE(NULLIF(?2, ''), chats.name), "
                        "last_message_time = MAX(COALESCE(chats.last_message_time, 0), ?3);");
    BindText(stmt.get(), 1, chat_id);
    BindText(stmt.get(), 2, name);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(util::ToUnixMillis(last_message_time)));
    return FromSqlite(sqlite3_step(stmt.get()), db_->Handle());
  } catch (const std::runtime_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

std::optional<ChatRecord> SqliteHistoryStore::GetChat(const std::string& chat_id) {
  auto stmt = Prepare(*db_, "SELECT jid, name, last_message_time FROM chats WHERE jid = ?;");
  BindText(stmt.get(), 1, chat_id);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::nullopt;

  ChatRecord record;
  record.chat_id           = ColumnText(stmt.get(), 0);
  record.name              = ColumnText(stmt.get(), 1);
  record.last_message_time = FromMillis(sqlite3_column_int64(stmt.get(), 2));
  return record;
}

std::vector<HistoryMessage> SqliteHistoryStore::RecentMessages(const std::string& chat_id, int limit) {
  auto stmt = Prepare(*db_,
                      "SELECT id, chat_jid, sender, content, timestamp, is_from_me, media_type, filename, url "
                      "FROM messages WHERE chat_jid = ? ORDER BY timestamp DESC, rowid DESC LIMIT ?;");
  BindText(stmt.get(), 1, chat_id);
  sqlite3_bind_int(stmt.get(), 2, limit);

  std::vector<HistoryMessage> out;
  int                         rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    HistoryMessage m;
    m.message_id = ColumnText(stmt.get(), 0);
    m.chat_id    = ColumnText(stmt.get(), 1);
    m.sender     = ColumnText(stmt.get(), 2);
    m.content    = ColumnText(stmt.get(), 3);
    m.timestamp  = FromMillis(sqlite3_column_int64(stmt.get(), 4));
    m.is_from_me = sqlite3_column_int(stmt.get(), 5) != 0;
    m.media_type = ColumnText(stmt.get(), 6);
    m.filename   = ColumnText(stmt.get(), 7);
    m.url        = ColumnText(stmt.get(), 8);
    out.push_back(std::move(m));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("history query: ") + sqlite3_errmsg(db_->Handle()));
  }

  // oldest first
  std::reverse(out.begin(), out.end());
  return out;
}

} // namespace chatrelay::history
