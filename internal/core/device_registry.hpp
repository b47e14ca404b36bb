#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/audit_logger.hpp"
#include "internal/core/fleet_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::core {

/*
  Device identity and the adoption state machine.

  A device is created Pending on first contact, moves to Approved or Rejected
  once by an administrator, and may later be Revoked. Rejected and Revoked
  devices are kept forever but may not check in again.
*/
class DeviceRegistry {
 public:
  DeviceRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<AuditLogger> audit,
                 FleetPolicy policy);

  // 1..128 characters of [A-Za-z0-9._:-]; throws InvalidArgument otherwise.
  static void ValidateDeviceId(const std::string& device_id);

  // system_info == nullptr keeps the stored snapshot.
  fleet::coordinator::core::v1::Device RegisterOrGreet(const std::string& device_id, const fleet::coordinator::core::v1::SystemInfo* system_info);

  /*
    The body of RegisterOrGreet for callers that need the greeting inside a
    larger transaction (the heartbeat). Locks the device row, creates it on
    first contact, refreshes last_seen_at. Throws Unauthorized for Rejected
    and Revoked devices. Creation transitions are appended to `transitions`.
  */
  db::model::DeviceRecord GreetInTransaction(db::Transaction& tx, const std::string& device_id,
                                             const fleet::coordinator::core::v1::SystemInfo* system_info, util::TimePoint now,
                                             std::vector<db::model::AuditRecord>& transitions);

  fleet::coordinator::core::v1::Device Decide(const std::string& device_id, fleet::coordinator::core::v1::AdoptionDecision decision,
                                              const std::string& administrator);

  fleet::coordinator::core::v1::Device Get(const std::string& device_id);

  // Ordered by device_id.
  std::vector<fleet::coordinator::core::v1::Device> List(std::optional<fleet::coordinator::core::v1::AdoptionState> state,
                                                         std::optional<bool> online);

  fleet::coordinator::core::v1::Device View(const db::model::DeviceRecord& record, util::TimePoint now) const;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  std::shared_ptr<AuditLogger>    audit_;
  FleetPolicy                     policy_;
};

} // namespace fleet::core
