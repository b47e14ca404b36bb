#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace fleet::grpc {

using namespace fleet::coordinator::services::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

// Request actor first, then x-fleet-actor; the core falls back to "admin".
template <typename Request>
Request WithActor(::grpc::ServerContext* context, const Request& req) {
  Request copy = req;
  if (copy.actor().empty()) {
    copy.set_actor(MetadataActor(context));
  }
  return copy;
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<fleet::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  return Handle([&] { *resp = service_->Health(*req); });
}

::grpc::Status AdminServer::ListDevices(::grpc::ServerContext*, const ListDevicesRequest* req, ListDevicesResponse* resp) {
  return Handle([&] { *resp = service_->ListDevices(*req); });
}

::grpc::Status AdminServer::GetDevice(::grpc::ServerContext*, const GetDeviceRequest* req, GetDeviceResponse* resp) {
  return Handle([&] { *resp = service_->GetDevice(*req); });
}

::grpc::Status AdminServer::DecideAdoption(::grpc::ServerContext* context, const DecideAdoptionRequest* req, DecideAdoptionResponse* resp) {
  return Handle([&] { *resp = service_->DecideAdoption(WithActor(context, *req)); });
}

::grpc::Status AdminServer::EnqueueAction(::grpc::ServerContext* context, const EnqueueActionRequest* req, EnqueueActionResponse* resp) {
  return Handle([&] { *resp = service_->EnqueueAction(WithActor(context, *req)); });
}

::grpc::Status AdminServer::GetAction(::grpc::ServerContext*, const GetActionRequest* req, GetActionResponse* resp) {
  return Handle([&] { *resp = service_->GetAction(*req); });
}

::grpc::Status AdminServer::ListActions(::grpc::ServerContext*, const ListActionsRequest* req, ListActionsResponse* resp) {
  return Handle([&] { *resp = service_->ListActions(*req); });
}

::grpc::Status AdminServer::CancelAction(::grpc::ServerContext* context, const CancelActionRequest* req, CancelActionResponse* resp) {
  return Handle([&] { *resp = service_->CancelAction(WithActor(context, *req)); });
}

::grpc::Status AdminServer::UpdateActionTtl(::grpc::ServerContext* context, const UpdateActionTtlRequest* req, UpdateActionTtlResponse* resp) {
  return Handle([&] { *resp = service_->UpdateActionTtl(WithActor(context, *req)); });
}

::grpc::Status AdminServer::GetActionTtl(::grpc::ServerContext*, const GetActionTtlRequest* req, GetActionTtlResponse* resp) {
  return Handle([&] { *resp = service_->GetActionTtl(*req); });
}

::grpc::Status AdminServer::QueryAudit(::grpc::ServerContext*, const QueryAuditRequest* req, QueryAuditResponse* resp) {
  return Handle([&] { *resp = service_->QueryAudit(*req); });
}

::grpc::Status AdminServer::History(::grpc::ServerContext*, const HistoryRequest* req, HistoryResponse* resp) {
  return Handle([&] { *resp = service_->History(*req); });
}

::grpc::Status AdminServer::Summary(::grpc::ServerContext*, const SummaryRequest* req, SummaryResponse* resp) {
  return Handle([&] { *resp = service_->Summary(*req); });
}

::grpc::Status AdminServer::SweepNow(::grpc::ServerContext*, const SweepNowRequest* req, SweepNowResponse* resp) {
  return Handle([&] { *resp = service_->SweepNow(*req); });
}

} // namespace fleet::grpc
