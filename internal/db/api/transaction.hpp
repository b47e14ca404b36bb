#pragma once

namespace fleet::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws TransactionConflict when a concurrent writer won,
    StorageError when the backend could not persist

  SQLite: BEGIN IMMEDIATE, one writer per process
  Postgres: pqxx::work
  Memory: snapshot copy-on-write + commit-time version check
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace fleet::db
