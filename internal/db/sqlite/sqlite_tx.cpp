#include "sqlite_tx.hpp"

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"

namespace fleet::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    FLEET_LOG_WARN("sqlite rollback failed", {fleet::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw StorageError(ErrorCode::InternalError, "transaction already finished");
  }
  // a failed COMMIT leaves the transaction open; the destructor rolls it back
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace fleet::db::sqlite
