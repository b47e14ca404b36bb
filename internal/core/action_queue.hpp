#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/core/audit_logger.hpp"
#include "internal/core/fleet_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::core {

struct ActionListQuery {
  std::optional<std::string>                                device_id;
  std::optional<fleet::coordinator::core::v1::ActionStatus> status;
  // 0 = kDefaultListLimit; capped at kMaxListLimit.
  std::size_t limit  = 0;
  std::size_t offset = 0;
};

/*
  Per-device FIFO of administrative commands.

    - Enqueue only targets Approved devices.
    - Delivery is pull-based: the oldest live Pending action is claimed on
      the device's heartbeat, and only while the device holds no other
      Delivered action.
    - Every status change is guarded by the expected current status, so a
      late result, a second claim or an overlapping sweep loses cleanly.
*/
class ActionQueue {
 public:
  static constexpr std::size_t kDefaultListLimit = 100;
  static constexpr std::size_t kMaxListLimit     = 1000;

  ActionQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<AuditLogger> audit,
              FleetPolicy policy);

  // ttl unset = default TTL. Negative throws InvalidArgument; values above max TTL are clamped.
  fleet::coordinator::core::v1::Action Enqueue(const std::string& device_id, const google::protobuf::Struct& spec,
                                               std::optional<std::chrono::seconds> ttl, const std::string& administrator);

  // Claims the next action for an Approved device, or nothing.
  std::optional<fleet::coordinator::core::v1::Action> NextPending(const std::string& device_id);

  // Claim step shared with the heartbeat transaction. The caller holds the device row.
  std::optional<db::model::ActionRecord> ClaimNextInTransaction(db::Transaction& tx, const std::string& device_id, util::TimePoint now,
                                                                std::vector<db::model::AuditRecord>& transitions);

  // reporting_device empty = the caller is trusted (admin path).
  fleet::coordinator::core::v1::Action Complete(uint64_t action_id, const google::protobuf::Struct& result, bool success,
                                                const std::string& reporting_device);

  fleet::coordinator::core::v1::Action Cancel(uint64_t action_id, const std::string& administrator);

  fleet::coordinator::core::v1::Action UpdateTtl(uint64_t action_id, std::chrono::seconds ttl, const std::string& administrator);

  // 0 for terminal or overdue actions.
  int64_t RemainingTtlSeconds(uint64_t action_id);

  fleet::coordinator::core::v1::Action Get(uint64_t action_id);

  std::vector<fleet::coordinator::core::v1::Action> List(const ActionListQuery& query);

 private:
  std::chrono::milliseconds ResolveTtl(std::optional<std::chrono::seconds> ttl) const;

  db::model::ActionRecord LoadAction(db::Transaction& tx, uint64_t action_id);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  std::shared_ptr<AuditLogger>    audit_;
  FleetPolicy                     policy_;
};

} // namespace fleet::core
