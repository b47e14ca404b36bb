#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace fleet::db {

/*
  Exceptions raised by the storage layer on paths that have no Result
  (reads, Begin, Commit). Driver exception types never leave a backend.
*/

class StorageError : public std::runtime_error {
 public:
  StorageError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

// Lost an optimistic or serialization race. The whole transaction may be retried.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fleet::db
