#include "sqlite_db.hpp"

#include "internal/db/api/errors.hpp"

namespace fleet::db::sqlite {

namespace {

ErrorCode CodeFor(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

void ThrowFor(int rc, const std::string& what) {
  if (CodeFor(rc) == ErrorCode::Busy) {
    throw TransactionConflict(what);
  }
  throw StorageError(CodeFor(rc), what);
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError(ErrorCode::IOError, "sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    ThrowFor(rc, msg);
  }
}

void SqliteDB::Configure() {
  // WAL keeps readers of other processes off the writer's back
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  int rc = sqlite3_busy_timeout(db_, 5000);
  if (rc != SQLITE_OK) {
    ThrowFor(rc, std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }

  // distinguish PRIMARY KEY/UNIQUE from other constraint failures
  sqlite3_extended_result_codes(db_, 1);

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace fleet::db::sqlite
