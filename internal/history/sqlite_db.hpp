#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace chatrelay::history {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Finalizes on scope exit.
struct StmtDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Throws std::runtime_error with the sqlite message.
Statement Prepare(const SqliteDB& db, const std::string& sql);

} // namespace chatrelay::history
