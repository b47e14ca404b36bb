#include "ttl_reaper.hpp"

#include "internal/core/transaction_runner.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace fleet::core {

using namespace fleet::coordinator::core::v1;

TtlReaper::TtlReaper(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<AuditLogger> audit,
                     FleetPolicy policy, ReaperOptions options)
    : repository_(std::move(repository)), clock_(std::move(clock)), audit_(std::move(audit)), policy_(policy), options_(options) {
}

SweepReport TtlReaper::Sweep() {
  observability::SpanScope span("reaper.sweep");

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  SweepReport report;
  report.expired_actions  = ExpireActions(now_ms);
  report.rejected_devices = RejectStaleDevices(now_ms);

  observability::Metrics::Instance().RecordReaperExpired("action", report.expired_actions);
  observability::Metrics::Instance().RecordReaperExpired("device", report.rejected_devices);
  if (report.expired_count() > 0) {
    FLEET_LOG_INFO("reaper sweep", {observability::IntField("expired_actions", static_cast<int64_t>(report.expired_actions)),
                                    observability::IntField("rejected_devices", static_cast<int64_t>(report.rejected_devices))});
  }
  span.SetAttribute("expired_count", static_cast<int64_t>(report.expired_count()));
  return report;
}

uint64_t TtlReaper::ExpireActions(uint64_t now_ms) {
  db::ActionFilter filter;
  filter.statuses           = {ACTION_STATUS_PENDING, ACTION_STATUS_DELIVERED};
  filter.deadline_before_ms = now_ms;
  filter.limit              = options_.batch_size;

  const auto candidates =
      RunInTransaction(*repository_, "reaper.scan_actions", [&](db::Transaction& tx) { return repository_->ListActions(tx, filter); });

  uint64_t expired = 0;
  for (const auto& candidate : candidates) {
    // One failing row must not hold back the rows scanned after it.
    try {
      if (ExpireAction(candidate.action_id, now_ms)) {
        ++expired;
      }
    } catch (const util::StorageFailure& e) {
      FLEET_LOG_WARN("reaper could not expire action", {observability::IntField("action_id", static_cast<int64_t>(candidate.action_id)),
                                                        observability::StringField("error", e.what())});
    }
  }
  return expired;
}

bool TtlReaper::ExpireAction(uint64_t action_id, uint64_t now_ms) {
  std::vector<db::model::AuditRecord> transitions;
  const bool moved = RunInTransaction(*repository_, "reaper.expire_action", [&](db::Transaction& tx) {
    transitions.clear();

    // Re-read: the row may have completed, been cancelled or re-armed since the scan.
    auto action = repository_->GetAction(tx, action_id);
    if (!action || model::IsTerminal(action->status) || action->ttl_deadline_ms >= now_ms) {
      return false;
    }

    const auto from = action->status;
    action->status  = ACTION_STATUS_EXPIRED;
    ThrowIfDbError(repository_->UpdateAction(tx, *action, from), "expire action " + std::to_string(action_id));
    transitions.push_back(audit_->Record(tx, SUBJECT_TYPE_ACTION, std::to_string(action_id), model::Name(from),
                                         model::Name(ACTION_STATUS_EXPIRED), Actor::Reaper(), "ttl deadline passed"));
    return true;
  });

  if (moved) {
    audit_->Announce(transitions);
  }
  return moved;
}

uint64_t TtlReaper::RejectStaleDevices(uint64_t now_ms) {
  const auto ttl_ms = static_cast<uint64_t>(policy_.pending_adoption_ttl.count());
  if (ttl_ms == 0 || now_ms <= ttl_ms) {
    return 0;
  }
  const auto cutoff_ms = now_ms - ttl_ms;

  db::DeviceFilter filter;
  filter.state                = ADOPTION_STATE_PENDING;
  filter.registered_before_ms = cutoff_ms;
  filter.limit                = options_.batch_size;

  const auto candidates =
      RunInTransaction(*repository_, "reaper.scan_devices", [&](db::Transaction& tx) { return repository_->ListDevices(tx, filter); });

  uint64_t rejected = 0;
  for (const auto& candidate : candidates) {
    try {
      if (RejectDevice(candidate.device_id, cutoff_ms)) {
        ++rejected;
      }
    } catch (const util::StorageFailure& e) {
      FLEET_LOG_WARN("reaper could not reject device",
                     {observability::StringField("device_id", candidate.device_id), observability::StringField("error", e.what())});
    }
  }
  return rejected;
}

bool TtlReaper::RejectDevice(const std::string& device_id, uint64_t cutoff_ms) {
  std::vector<db::model::AuditRecord> transitions;
  const bool moved = RunInTransaction(*repository_, "reaper.reject_device", [&](db::Transaction& tx) {
    transitions.clear();

    auto device = repository_->LockDevice(tx, device_id);
    if (!device || device->adoption_state != ADOPTION_STATE_PENDING || device->registered_at_ms >= cutoff_ms) {
      return false;
    }

    device->adoption_state = ADOPTION_STATE_REJECTED;
    ThrowIfDbError(repository_->UpdateDevice(tx, *device, ADOPTION_STATE_PENDING), "reject device " + device_id);
    transitions.push_back(audit_->Record(tx, SUBJECT_TYPE_DEVICE, device_id, model::Name(ADOPTION_STATE_PENDING),
                                         model::Name(ADOPTION_STATE_REJECTED), Actor::Reaper(), "pending adoption expired"));
    return true;
  });

  if (moved) {
    audit_->Announce(transitions);
  }
  return moved;
}

} // namespace fleet::core
