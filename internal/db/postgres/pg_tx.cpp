#include "pg_tx.hpp"

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"

namespace fleet::db::postgres {

void RethrowAsStorageError(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    throw TransactionConflict(e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    throw StorageError(ErrorCode::IOError, e.what());
  }
  throw StorageError(ErrorCode::InternalError, e.what());
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

PgTransaction::~PgTransaction() {
  if (finished_ || !tx_) {
    return;
  }
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    FLEET_LOG_WARN("postgres rollback failed", {fleet::observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (finished_) {
    throw StorageError(ErrorCode::InternalError, "transaction already finished");
  }
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  tx_->abort();
}

} // namespace fleet::db::postgres
