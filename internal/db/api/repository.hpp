#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/action_record.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/device_record.hpp"

namespace fleet::db {

struct DeviceFilter {
  std::optional<fleet::coordinator::core::v1::AdoptionState> state;
  // Only devices with registered_at_ms strictly below this.
  std::optional<uint64_t> registered_before_ms;
  // Only devices with last_seen_at_ms at or above this.
  std::optional<uint64_t> seen_since_ms;
  // 0 = no limit
  std::size_t limit = 0;
};

struct ActionFilter {
  std::optional<std::string> device_id;
  // Empty = any status.
  std::vector<fleet::coordinator::core::v1::ActionStatus> statuses;
  // ttl_deadline_ms < deadline_before_ms
  std::optional<uint64_t> deadline_before_ms;
  // ttl_deadline_ms >= deadline_not_before_ms
  std::optional<uint64_t> deadline_not_before_ms;
  std::size_t             limit  = 0;
  std::size_t             offset = 0;
};

struct AuditFilter {
  std::optional<fleet::coordinator::core::v1::SubjectType> subject_type;
  std::optional<std::string>                               subject_id;
  uint64_t                                                 after_entry_id = 0;
  std::size_t                                              limit          = 0;
  bool                                                     newest_first   = false;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - UpdateDevice / UpdateAction are guarded: they succeed only while the
    stored row still holds the expected state, else ErrorCode::Conflict.
    This is the forward-only transition guard at the store level.
  - Ids for actions and audit rows are assigned here, monotonically
  - Nothing is ever deleted; audit rows are never updated

  Ordering:
    ListDevices  -> device_id ascending
    ListActions  -> created_at_ms, then action_id ascending
    ListAudit    -> entry_id ascending (descending when newest_first)

  The DB is the source of truth for:
    device identity + adoption state
    action lifecycle
    the audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Devices
  // ---------------------------------------------------------------------

  // AlreadyExists when the id is taken.
  virtual Result InsertDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string& device_id) = 0;

  // Same as GetDevice, but holds the row until the transaction ends where the backend supports row locks.
  virtual std::optional<model::DeviceRecord> LockDevice(Transaction&, const std::string& device_id) = 0;

  virtual Result UpdateDevice(Transaction&, const model::DeviceRecord&, fleet::coordinator::core::v1::AdoptionState expected_state) = 0;

  virtual std::vector<model::DeviceRecord> ListDevices(Transaction&, const DeviceFilter&) = 0;

  // Ignores DeviceFilter::limit.
  virtual uint64_t CountDevices(Transaction&, const DeviceFilter&) = 0;

  virtual std::map<fleet::coordinator::core::v1::AdoptionState, uint64_t> CountDevicesByState(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Actions
  // ---------------------------------------------------------------------

  // Assigns record.action_id.
  virtual Result InsertAction(Transaction&, model::ActionRecord&) = 0;

  virtual std::optional<model::ActionRecord> GetAction(Transaction&, uint64_t action_id) = 0;

  virtual Result UpdateAction(Transaction&, const model::ActionRecord&, fleet::coordinator::core::v1::ActionStatus expected_status) = 0;

  virtual std::vector<model::ActionRecord> ListActions(Transaction&, const ActionFilter&) = 0;

  virtual std::map<fleet::coordinator::core::v1::ActionStatus, uint64_t> CountActionsByStatus(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Audit
  // ---------------------------------------------------------------------

  // Assigns record.entry_id.
  virtual Result AppendAudit(Transaction&, model::AuditRecord&) = 0;

  virtual std::vector<model::AuditRecord> ListAudit(Transaction&, const AuditFilter&) = 0;
};

} // namespace fleet::db
