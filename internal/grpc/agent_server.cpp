#include "agent_server.hpp"

#include "grpc_error.hpp"

namespace fleet::grpc {

using namespace fleet::coordinator::services::v1;

AgentServer::AgentServer(std::shared_ptr<fleet::service::AgentService> svc) : service_(std::move(svc)) {
}

::grpc::Status AgentServer::Heartbeat(::grpc::ServerContext*, const HeartbeatRequest* req, HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::RegisterDevice(::grpc::ServerContext*, const RegisterDeviceRequest* req, RegisterDeviceResponse* resp) {
  try {
    *resp = service_->RegisterDevice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AgentServer::CompleteAction(::grpc::ServerContext*, const CompleteActionRequest* req, CompleteActionResponse* resp) {
  try {
    *resp = service_->CompleteAction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fleet::grpc
