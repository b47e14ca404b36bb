#include "transaction_runner.hpp"

namespace fleet::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context + ": " + std::string(db::ErrorCodeName(result.code))
                                              : context + ": " + result.message;
  switch (result.code) {
    // guarded update lost to a concurrent writer, or an insert race
    case db::ErrorCode::Conflict:
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw db::TransactionConflict(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageFailure(message);
  }
}

} // namespace fleet::core
