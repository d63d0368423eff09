#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace flowstead::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all threads (FULLMUTEX); TxMutex()
  serializes transactions on it since SQLite cannot nest BEGIN on a
  single connection.
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace flowstead::db::sqlite
