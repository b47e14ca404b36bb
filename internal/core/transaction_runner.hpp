#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "internal/db/api/errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::core {

/*
  Every core operation is one short transaction run through here.

  - fn(tx) does all reads and guarded writes (audit included); Commit follows.
  - A lost race (TransactionConflict) re-runs fn on a fresh transaction, up
    to kMaxTransactionAttempts times. fn must therefore be restartable: reset
    any state it collects at the top.
  - Exhausted retries and backend failures become util::StorageFailure.
  - Domain errors thrown by fn propagate unchanged and roll back.
*/

inline constexpr int kMaxTransactionAttempts = 3;

// Maps a repository write result to the exception the runner understands.
void ThrowIfDbError(const db::Result& result, const std::string& context);

template <typename Fn>
auto RunInTransaction(db::Repository& repository, std::string_view op, Fn&& fn) -> std::invoke_result_t<Fn&, db::Transaction&> {
  using ResultType = std::invoke_result_t<Fn&, db::Transaction&>;

  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repository.Begin();
      if constexpr (std::is_void_v<ResultType>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        ResultType result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const db::TransactionConflict& e) {
      if (attempt >= kMaxTransactionAttempts) {
        throw util::StorageFailure(std::string(op) + ": transaction kept conflicting: " + e.what());
      }
      FLEET_LOG_WARN("transaction conflict, retrying",
                     {observability::StringField("op", op), observability::IntField("attempt", attempt), observability::StringField("error", e.what())});
    } catch (const db::StorageError& e) {
      throw util::StorageFailure(std::string(op) + ": " + e.what());
    }
  }
}

} // namespace fleet::core
