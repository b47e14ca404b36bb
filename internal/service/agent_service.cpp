#include "agent_service.hpp"

#include "internal/core/action_queue.hpp"
#include "internal/core/device_registry.hpp"
#include "internal/core/heartbeat_monitor.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleet::service {

using namespace fleet::coordinator::core::v1;
using namespace fleet::coordinator::services::v1;

AgentService::AgentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HeartbeatResponse AgentService::Heartbeat(const HeartbeatRequest& req) {
  return ObserveRpc("AgentService.Heartbeat", {req.device_id()}, [&] {
    auto result = ctx_.heartbeat->Heartbeat(req.device_id(), req.has_system_info() ? &req.system_info() : nullptr);

    HeartbeatResponse resp;
    resp.set_status(result.status);
    resp.set_adoption_state(result.device.adoption_state());
    *resp.mutable_server_time() = util::ToProto(result.server_time);
    if (result.next_action) {
      *resp.mutable_next_action() = std::move(*result.next_action);
    }
    return resp;
  });
}

RegisterDeviceResponse AgentService::RegisterDevice(const RegisterDeviceRequest& req) {
  return ObserveRpc("AgentService.RegisterDevice", {req.device_id()}, [&] {
    auto device = ctx_.registry->RegisterOrGreet(req.device_id(), req.has_system_info() ? &req.system_info() : nullptr);

    RegisterDeviceResponse resp;
    resp.set_status(std::string(model::Name(device.adoption_state())));
    *resp.mutable_device() = std::move(device);
    return resp;
  });
}

CompleteActionResponse AgentService::CompleteAction(const CompleteActionRequest& req) {
  return ObserveRpc("AgentService.CompleteAction", {req.device_id(), req.action_id()}, [&] {
    if (req.action_id() == 0) {
      throw util::InvalidArgument("action_id is required");
    }

    CompleteActionResponse resp;
    *resp.mutable_action() = ctx_.queue->Complete(req.action_id(), req.result(), req.success(), req.device_id());
    return resp;
  });
}

} // namespace fleet::service
