#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace convtree::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema bootstrap)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Held by each open SqliteTransaction; one transaction per connection.
  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
  std::mutex  tx_mutex_;
};

/*
  Owns one prepared statement. Bind indexes are 1-based, column
  indexes 0-based, as in the sqlite3 C API.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindOptionalText(int idx, const std::optional<std::string>& value);
  void BindInt64(int idx, int64_t value);
  void BindU64(int idx, uint64_t value);

  // true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise.
  bool Next();

  // Runs a write to completion and returns the raw result code.
  int Execute();

  std::string                ColumnText(int col) const;
  std::optional<std::string> ColumnOptionalText(int col) const;
  int64_t                    ColumnInt64(int col) const;
  uint64_t                   ColumnU64(int col) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace convtree::db::sqlite
