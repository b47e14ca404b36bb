#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/audit_logger.hpp"
#include "internal/core/fleet_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace fleet::core {

struct SweepReport {
  uint64_t expired_actions  = 0;
  uint64_t rejected_devices = 0;

  uint64_t expired_count() const {
    return expired_actions + rejected_devices;
  }
};

/*
  Expires overdue actions and auto-rejects stale Pending devices.

  Candidates are read first, then each row moves in its own transaction
  guarded by its expected state. A row that an agent, an administrator or an
  overlapping sweep has already moved is skipped, so sweeps are idempotent
  and may run concurrently.
*/
class TtlReaper {
 public:
  TtlReaper(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<AuditLogger> audit,
            FleetPolicy policy, ReaperOptions options);

  SweepReport Sweep();

 private:
  uint64_t ExpireActions(uint64_t now_ms);
  uint64_t RejectStaleDevices(uint64_t now_ms);

  // Each moves one row in its own transaction; false when it was already moved.
  bool ExpireAction(uint64_t action_id, uint64_t now_ms);
  bool RejectDevice(const std::string& device_id, uint64_t cutoff_ms);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  std::shared_ptr<AuditLogger>    audit_;
  FleetPolicy                     policy_;
  ReaperOptions                   options_;
};

} // namespace fleet::core
