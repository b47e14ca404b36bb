#include "heartbeat_monitor.hpp"

#include "internal/core/conversions.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/model/state_machine.hpp"

namespace fleet::core {

using namespace fleet::coordinator::core::v1;

HeartbeatMonitor::HeartbeatMonitor(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                   std::shared_ptr<DeviceRegistry> registry, std::shared_ptr<ActionQueue> queue,
                                   std::shared_ptr<AuditLogger> audit)
    : repository_(std::move(repository)), clock_(std::move(clock)), registry_(std::move(registry)), queue_(std::move(queue)),
      audit_(std::move(audit)) {
}

HeartbeatResult HeartbeatMonitor::Heartbeat(const std::string& device_id, const SystemInfo* system_info) {
  DeviceRegistry::ValidateDeviceId(device_id);

  struct Outcome {
    db::model::DeviceRecord                device;
    std::optional<db::model::ActionRecord> claimed;
    util::TimePoint                        now;
  };

  std::vector<db::model::AuditRecord> transitions;
  auto outcome = RunInTransaction(*repository_, "device.heartbeat", [&](db::Transaction& tx) {
    transitions.clear();

    Outcome result;
    result.now    = clock_->Now();
    result.device = registry_->GreetInTransaction(tx, device_id, system_info, result.now, transitions);
    if (result.device.adoption_state == ADOPTION_STATE_APPROVED) {
      result.claimed = queue_->ClaimNextInTransaction(tx, device_id, result.now, transitions);
    }
    return result;
  });

  audit_->Announce(transitions);

  HeartbeatResult response;
  response.status      = std::string(model::Name(outcome.device.adoption_state));
  response.device      = registry_->View(outcome.device, outcome.now);
  response.server_time = outcome.now;
  if (outcome.claimed) {
    response.next_action = ToAction(*outcome.claimed);
  }
  return response;
}

} // namespace fleet::core
