#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace favorites::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is opened in serialized (FULLMUTEX) mode; Lock() is used
  by callers that need several statements to observe one another
  (e.g. sqlite3_changes after a DELETE).
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::unique_lock<std::recursive_mutex> Lock() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*             db_ = nullptr;
  std::string          path_;
  std::recursive_mutex mutex_;
};

} // namespace favorites::db::sqlite
