#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace fleet::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction of the process, so only one
  transaction may be open at a time: SqliteTransaction holds TxMutex() from
  BEGIN IMMEDIATE until COMMIT/ROLLBACK.
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT).
  // Throws TransactionConflict on SQLITE_BUSY/LOCKED, StorageError otherwise.
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace fleet::db::sqlite
