#include "admin_service.hpp"

#include <chrono>
#include <limits>
#include <map>
#include <optional>

#include "internal/core/action_queue.hpp"
#include "internal/core/audit_logger.hpp"
#include "internal/core/device_registry.hpp"
#include "internal/core/ttl_reaper.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace fleet::service {

using namespace fleet::coordinator::core::v1;
using namespace fleet::coordinator::services::v1;

namespace {

uint64_t CountOf(const std::map<AdoptionState, uint64_t>& counts, AdoptionState state) {
  auto it = counts.find(state);
  return it == counts.end() ? 0 : it->second;
}

uint64_t CountOf(const std::map<ActionStatus, uint64_t>& counts, ActionStatus status) {
  auto it = counts.find(status);
  return it == counts.end() ? 0 : it->second;
}

std::chrono::seconds ToTtl(uint64_t ttl_seconds) {
  if (ttl_seconds > static_cast<uint64_t>(std::numeric_limits<int64_t>::max() / 1000)) {
    throw util::InvalidArgument("ttl_seconds out of range");
  }
  return std::chrono::seconds(static_cast<int64_t>(ttl_seconds));
}

void RequireActionId(uint64_t action_id) {
  if (action_id == 0) {
    throw util::InvalidArgument("action_id is required");
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthResponse AdminService::Health(const HealthRequest&) {
  return ObserveRpc("AdminService.Health", {}, [] {
    HealthResponse resp;
    resp.set_status("ok");
    return resp;
  });
}

ListDevicesResponse AdminService::ListDevices(const ListDevicesRequest& req) {
  return ObserveRpc("AdminService.ListDevices", {}, [&] {
    std::optional<AdoptionState> state;
    if (req.state() != ADOPTION_STATE_UNSPECIFIED) {
      state = req.state();
    }
    std::optional<bool> online;
    if (req.has_online()) {
      online = req.online();
    }

    ListDevicesResponse resp;
    for (auto& device : ctx_.registry->List(state, online)) {
      *resp.add_devices() = std::move(device);
    }
    return resp;
  });
}

GetDeviceResponse AdminService::GetDevice(const GetDeviceRequest& req) {
  return ObserveRpc("AdminService.GetDevice", {req.device_id()}, [&] {
    GetDeviceResponse resp;
    *resp.mutable_device() = ctx_.registry->Get(req.device_id());
    return resp;
  });
}

DecideAdoptionResponse AdminService::DecideAdoption(const DecideAdoptionRequest& req) {
  return ObserveRpc("AdminService.DecideAdoption", {req.device_id()}, [&] {
    DecideAdoptionResponse resp;
    *resp.mutable_device() = ctx_.registry->Decide(req.device_id(), req.decision(), req.actor());
    return resp;
  });
}

EnqueueActionResponse AdminService::EnqueueAction(const EnqueueActionRequest& req) {
  return ObserveRpc("AdminService.EnqueueAction", {req.device_id()}, [&] {
    std::optional<std::chrono::seconds> ttl;
    if (req.has_ttl_seconds()) {
      ttl = ToTtl(req.ttl_seconds());
    }

    EnqueueActionResponse resp;
    *resp.mutable_action() = ctx_.queue->Enqueue(req.device_id(), req.spec(), ttl, req.actor());
    return resp;
  });
}

GetActionResponse AdminService::GetAction(const GetActionRequest& req) {
  return ObserveRpc("AdminService.GetAction", {{}, req.action_id()}, [&] {
    RequireActionId(req.action_id());
    GetActionResponse resp;
    *resp.mutable_action() = ctx_.queue->Get(req.action_id());
    return resp;
  });
}

ListActionsResponse AdminService::ListActions(const ListActionsRequest& req) {
  return ObserveRpc("AdminService.ListActions", {req.device_id()}, [&] {
    core::ActionListQuery query;
    if (!req.device_id().empty()) {
      query.device_id = req.device_id();
    }
    if (req.status() != ACTION_STATUS_UNSPECIFIED) {
      query.status = req.status();
    }
    query.limit  = req.limit();
    query.offset = req.offset();

    ListActionsResponse resp;
    for (auto& action : ctx_.queue->List(query)) {
      *resp.add_actions() = std::move(action);
    }
    return resp;
  });
}

CancelActionResponse AdminService::CancelAction(const CancelActionRequest& req) {
  return ObserveRpc("AdminService.CancelAction", {{}, req.action_id()}, [&] {
    RequireActionId(req.action_id());
    CancelActionResponse resp;
    *resp.mutable_action() = ctx_.queue->Cancel(req.action_id(), req.actor());
    return resp;
  });
}

UpdateActionTtlResponse AdminService::UpdateActionTtl(const UpdateActionTtlRequest& req) {
  return ObserveRpc("AdminService.UpdateActionTtl", {{}, req.action_id()}, [&] {
    RequireActionId(req.action_id());
    UpdateActionTtlResponse resp;
    *resp.mutable_action() = ctx_.queue->UpdateTtl(req.action_id(), ToTtl(req.ttl_seconds()), req.actor());
    return resp;
  });
}

GetActionTtlResponse AdminService::GetActionTtl(const GetActionTtlRequest& req) {
  return ObserveRpc("AdminService.GetActionTtl", {{}, req.action_id()}, [&] {
    RequireActionId(req.action_id());
    GetActionTtlResponse resp;
    resp.set_remaining_seconds(ctx_.queue->RemainingTtlSeconds(req.action_id()));
    return resp;
  });
}

QueryAuditResponse AdminService::QueryAudit(const QueryAuditRequest& req) {
  return ObserveRpc("AdminService.QueryAudit", {}, [&] {
    core::AuditQuery query;
    if (req.subject_type() != SUBJECT_TYPE_UNSPECIFIED) {
      query.subject_type = req.subject_type();
    }
    if (!req.subject_id().empty()) {
      query.subject_id = req.subject_id();
    }
    query.after_entry_id = req.after_entry_id();
    query.limit          = req.limit();

    QueryAuditResponse resp;
    for (auto& entry : ctx_.audit->Query(query)) {
      *resp.add_entries() = std::move(entry);
    }
    return resp;
  });
}

HistoryResponse AdminService::History(const HistoryRequest& req) {
  return ObserveRpc("AdminService.History", {}, [&] {
    HistoryResponse resp;
    for (auto& entry : ctx_.audit->History(req.limit())) {
      *resp.add_history() = std::move(entry);
    }
    return resp;
  });
}

SummaryResponse AdminService::Summary(const SummaryRequest&) {
  return ObserveRpc("AdminService.Summary", {}, [&] {
    const auto summary = ctx_.audit->Summary();

    SummaryResponse resp;
    resp.set_devices_total(summary.devices_total);
    resp.set_devices_pending(CountOf(summary.devices_by_state, ADOPTION_STATE_PENDING));
    resp.set_devices_approved(CountOf(summary.devices_by_state, ADOPTION_STATE_APPROVED));
    resp.set_devices_rejected(CountOf(summary.devices_by_state, ADOPTION_STATE_REJECTED));
    resp.set_devices_revoked(CountOf(summary.devices_by_state, ADOPTION_STATE_REVOKED));
    resp.set_devices_online(summary.devices_online);
    resp.set_actions_pending(CountOf(summary.actions_by_status, ACTION_STATUS_PENDING));
    resp.set_actions_delivered(CountOf(summary.actions_by_status, ACTION_STATUS_DELIVERED));
    resp.set_actions_completed(CountOf(summary.actions_by_status, ACTION_STATUS_COMPLETED));
    resp.set_actions_failed(CountOf(summary.actions_by_status, ACTION_STATUS_FAILED));
    resp.set_actions_expired(CountOf(summary.actions_by_status, ACTION_STATUS_EXPIRED));
    return resp;
  });
}

SweepNowResponse AdminService::SweepNow(const SweepNowRequest&) {
  return ObserveRpc("AdminService.SweepNow", {}, [&] {
    const auto report = ctx_.reaper->Sweep();

    SweepNowResponse resp;
    resp.set_expired_actions(report.expired_actions);
    resp.set_rejected_devices(report.rejected_devices);
    resp.set_expired_count(report.expired_count());
    return resp;
  });
}

} // namespace fleet::service
