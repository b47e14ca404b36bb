#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "fleet/coordinator/services/v1/fleet_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace fleet::grpc {

class AdminServer final : public fleet::coordinator::services::v1::FleetAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<fleet::service::AdminService> svc);

  ::grpc::Status Health(::grpc::ServerContext*, const fleet::coordinator::services::v1::HealthRequest*,
                        fleet::coordinator::services::v1::HealthResponse*) override;

  ::grpc::Status ListDevices(::grpc::ServerContext*, const fleet::coordinator::services::v1::ListDevicesRequest*,
                             fleet::coordinator::services::v1::ListDevicesResponse*) override;
  ::grpc::Status GetDevice(::grpc::ServerContext*, const fleet::coordinator::services::v1::GetDeviceRequest*,
                           fleet::coordinator::services::v1::GetDeviceResponse*) override;
  ::grpc::Status DecideAdoption(::grpc::ServerContext*, const fleet::coordinator::services::v1::DecideAdoptionRequest*,
                                fleet::coordinator::services::v1::DecideAdoptionResponse*) override;

  ::grpc::Status EnqueueAction(::grpc::ServerContext*, const fleet::coordinator::services::v1::EnqueueActionRequest*,
                               fleet::coordinator::services::v1::EnqueueActionResponse*) override;
  ::grpc::Status GetAction(::grpc::ServerContext*, const fleet::coordinator::services::v1::GetActionRequest*,
                           fleet::coordinator::services::v1::GetActionResponse*) override;
  ::grpc::Status ListActions(::grpc::ServerContext*, const fleet::coordinator::services::v1::ListActionsRequest*,
                             fleet::coordinator::services::v1::ListActionsResponse*) override;
  ::grpc::Status CancelAction(::grpc::ServerContext*, const fleet::coordinator::services::v1::CancelActionRequest*,
                              fleet::coordinator::services::v1::CancelActionResponse*) override;
  ::grpc::Status UpdateActionTtl(::grpc::ServerContext*, const fleet::coordinator::services::v1::UpdateActionTtlRequest*,
                                 fleet::coordinator::services::v1::UpdateActionTtlResponse*) override;
  ::grpc::Status GetActionTtl(::grpc::ServerContext*, const fleet::coordinator::services::v1::GetActionTtlRequest*,
                              fleet::coordinator::services::v1::GetActionTtlResponse*) override;

  ::grpc::Status QueryAudit(::grpc::ServerContext*, const fleet::coordinator::services::v1::QueryAuditRequest*,
                            fleet::coordinator::services::v1::QueryAuditResponse*) override;
  ::grpc::Status History(::grpc::ServerContext*, const fleet::coordinator::services::v1::HistoryRequest*,
                         fleet::coordinator::services::v1::HistoryResponse*) override;
  ::grpc::Status Summary(::grpc::ServerContext*, const fleet::coordinator::services::v1::SummaryRequest*,
                         fleet::coordinator::services::v1::SummaryResponse*) override;

  ::grpc::Status SweepNow(::grpc::ServerContext*, const fleet::coordinator::services::v1::SweepNowRequest*,
                          fleet::coordinator::services::v1::SweepNowResponse*) override;

 private:
  std::shared_ptr<fleet::service::AdminService> service_;
};

} // namespace fleet::grpc
