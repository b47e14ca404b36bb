#pragma once

#include <memory>

namespace fleet::core {
class ActionQueue;
class AuditLogger;
class DeviceRegistry;
class HeartbeatMonitor;
class TtlReaper;
} // namespace fleet::core

namespace fleet::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fleet::core::DeviceRegistry>   registry;
  std::shared_ptr<fleet::core::ActionQueue>      queue;
  std::shared_ptr<fleet::core::HeartbeatMonitor> heartbeat;
  std::shared_ptr<fleet::core::TtlReaper>        reaper;
  std::shared_ptr<fleet::core::AuditLogger>      audit;
};

} // namespace fleet::service
