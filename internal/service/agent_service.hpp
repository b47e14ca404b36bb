#pragma once

#include "fleet/coordinator/services/v1/fleet_agent_service.pb.h"
#include "service_context.hpp"

namespace fleet::service {

/*
  Calls made by device agents: check-in and result reporting.
*/
class AgentService {
 public:
  explicit AgentService(ServiceContext ctx);

  fleet::coordinator::services::v1::HeartbeatResponse Heartbeat(const fleet::coordinator::services::v1::HeartbeatRequest& req);

  fleet::coordinator::services::v1::RegisterDeviceResponse RegisterDevice(const fleet::coordinator::services::v1::RegisterDeviceRequest& req);

  fleet::coordinator::services::v1::CompleteActionResponse CompleteAction(const fleet::coordinator::services::v1::CompleteActionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace fleet::service
