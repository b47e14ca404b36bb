#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/core/action_queue.hpp"
#include "internal/core/audit_logger.hpp"
#include "internal/core/device_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::core {

struct HeartbeatResult {
  // Lowercase adoption state: "pending", "approved".
  std::string                                         status;
  fleet::coordinator::core::v1::Device                device;
  std::optional<fleet::coordinator::core::v1::Action> next_action;
  util::TimePoint                                     server_time;
};

/*
  Agent check-in.

  The greeting (create or refresh last_seen_at) and the claim of the next
  action commit together in one transaction: an action is never Delivered
  without the heartbeat that carried it, and two concurrent heartbeats of one
  device cannot both take an action.
*/
class HeartbeatMonitor {
 public:
  HeartbeatMonitor(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<DeviceRegistry> registry,
                   std::shared_ptr<ActionQueue> queue, std::shared_ptr<AuditLogger> audit);

  // system_info == nullptr is a command poll: the stored snapshot is kept.
  HeartbeatResult Heartbeat(const std::string& device_id, const fleet::coordinator::core::v1::SystemInfo* system_info);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  std::shared_ptr<DeviceRegistry> registry_;
  std::shared_ptr<ActionQueue>    queue_;
  std::shared_ptr<AuditLogger>    audit_;
};

} // namespace fleet::core
