#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace credpool::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction of the process, so
  transactions are serialised in-process by writer_mutex_; other
  processes are serialised by the database file lock and
  busy_timeout. Both waits are bounded by busy_timeout_ms.
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

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations); throws on error.
  void Exec(const std::string& sql);

  // Execute and return the sqlite result code instead of throwing.
  int TryExec(const std::string& sql, std::string* error);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  std::chrono::milliseconds BusyTimeout() const {
    return std::chrono::milliseconds(busy_timeout_ms_);
  }

  std::timed_mutex& WriterMutex() {
    return writer_mutex_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*         db_ = nullptr;
  std::string      path_;
  int              busy_timeout_ms_;
  std::timed_mutex writer_mutex_;
};

} // namespace credpool::db::sqlite
