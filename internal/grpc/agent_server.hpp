#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "fleet/coordinator/services/v1/fleet_agent_service.grpc.pb.h"
#include "internal/service/agent_service.hpp"

namespace fleet::grpc {

class AgentServer final : public fleet::coordinator::services::v1::FleetAgentService::Service {
 public:
  explicit AgentServer(std::shared_ptr<fleet::service::AgentService> svc);

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const fleet::coordinator::services::v1::HeartbeatRequest*,
                           fleet::coordinator::services::v1::HeartbeatResponse*) override;

  ::grpc::Status RegisterDevice(::grpc::ServerContext*, const fleet::coordinator::services::v1::RegisterDeviceRequest*,
                                fleet::coordinator::services::v1::RegisterDeviceResponse*) override;

  ::grpc::Status CompleteAction(::grpc::ServerContext*, const fleet::coordinator::services::v1::CompleteActionRequest*,
                                fleet::coordinator::services::v1::CompleteActionResponse*) override;

 private:
  std::shared_ptr<fleet::service::AgentService> service_;
};

} // namespace fleet::grpc
