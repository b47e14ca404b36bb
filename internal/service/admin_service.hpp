#pragma once

#include "fleet/coordinator/services/v1/fleet_admin_service.pb.h"
#include "service_context.hpp"

namespace fleet::service {

/*
  Operator surface: adoption decisions, the action queue, audit queries and
  the reaper. Each request's `actor` names the administrator; transport
  adapters fill it in when the caller left it empty.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  fleet::coordinator::services::v1::HealthResponse Health(const fleet::coordinator::services::v1::HealthRequest& req);

  fleet::coordinator::services::v1::ListDevicesResponse    ListDevices(const fleet::coordinator::services::v1::ListDevicesRequest& req);
  fleet::coordinator::services::v1::GetDeviceResponse      GetDevice(const fleet::coordinator::services::v1::GetDeviceRequest& req);
  fleet::coordinator::services::v1::DecideAdoptionResponse DecideAdoption(const fleet::coordinator::services::v1::DecideAdoptionRequest& req);

  fleet::coordinator::services::v1::EnqueueActionResponse   EnqueueAction(const fleet::coordinator::services::v1::EnqueueActionRequest& req);
  fleet::coordinator::services::v1::GetActionResponse       GetAction(const fleet::coordinator::services::v1::GetActionRequest& req);
  fleet::coordinator::services::v1::ListActionsResponse     ListActions(const fleet::coordinator::services::v1::ListActionsRequest& req);
  fleet::coordinator::services::v1::CancelActionResponse    CancelAction(const fleet::coordinator::services::v1::CancelActionRequest& req);
  fleet::coordinator::services::v1::UpdateActionTtlResponse UpdateActionTtl(const fleet::coordinator::services::v1::UpdateActionTtlRequest& req);
  fleet::coordinator::services::v1::GetActionTtlResponse    GetActionTtl(const fleet::coordinator::services::v1::GetActionTtlRequest& req);

  fleet::coordinator::services::v1::QueryAuditResponse QueryAudit(const fleet::coordinator::services::v1::QueryAuditRequest& req);
  fleet::coordinator::services::v1::HistoryResponse    History(const fleet::coordinator::services::v1::HistoryRequest& req);
  fleet::coordinator::services::v1::SummaryResponse    Summary(const fleet::coordinator::services::v1::SummaryRequest& req);

  fleet::coordinator::services::v1::SweepNowResponse SweepNow(const fleet::coordinator::services::v1::SweepNowRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace fleet::service
