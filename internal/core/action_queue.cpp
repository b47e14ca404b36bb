#include "action_queue.hpp"

#include <algorithm>

#include "internal/core/conversions.hpp"
#include "internal/core/device_registry.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleet::core {

using namespace fleet::coordinator::core::v1;

namespace {

std::string ActionLabel(uint64_t action_id) {
  return "action " + std::to_string(action_id);
}

void RequireTransition(const db::model::ActionRecord& action, ActionStatus to) {
  if (!model::CanTransition(action.status, to)) {
    throw util::InvalidStateTransition(ActionLabel(action.action_id) + ": " + std::string(model::Name(action.status)) + " -> " +
                                       std::string(model::Name(to)) + " is not allowed");
  }
}

} // namespace

ActionQueue::ActionQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<AuditLogger> audit,
                         FleetPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), audit_(std::move(audit)), policy_(policy) {
}

std::chrono::milliseconds ActionQueue::ResolveTtl(std::optional<std::chrono::seconds> ttl) const {
  if (!ttl) {
    return std::min(policy_.default_action_ttl, policy_.max_action_ttl);
  }
  if (ttl->count() < 0) {
    throw util::InvalidArgument("ttl must not be negative");
  }
  return std::min(std::chrono::duration_cast<std::chrono::milliseconds>(*ttl), policy_.max_action_ttl);
}

db::model::ActionRecord ActionQueue::LoadAction(db::Transaction& tx, uint64_t action_id) {
  auto action = repository_->GetAction(tx, action_id);
  if (!action) {
    throw util::NotFound("unknown " + ActionLabel(action_id));
  }
  return *action;
}

Action ActionQueue::Enqueue(const std::string& device_id, const google::protobuf::Struct& spec, std::optional<std::chrono::seconds> ttl,
                            const std::string& administrator) {
  DeviceRegistry::ValidateDeviceId(device_id);
  const auto ttl_ms    = ResolveTtl(ttl);
  const auto actor     = Actor::Administrator(administrator);
  const auto spec_json = util::ToJson(spec);

  std::vector<db::model::AuditRecord> transitions;
  auto record = RunInTransaction(*repository_, "action.enqueue", [&](db::Transaction& tx) {
    transitions.clear();

    // Held until commit so a concurrent revoke cannot slip in between.
    auto device = repository_->LockDevice(tx, device_id);
    if (!device) {
      throw util::UnknownDevice("unknown device " + device_id);
    }
    if (device->adoption_state != ADOPTION_STATE_APPROVED) {
      throw util::UnknownDevice("device " + device_id + " is " + std::string(model::Name(device->adoption_state)) + ", not approved");
    }

    const auto now_ms = util::ToUnixMillis(clock_->Now());

    db::model::ActionRecord action;
    action.device_id       = device_id;
    action.spec_json       = spec_json;
    action.status          = ACTION_STATUS_PENDING;
    action.created_at_ms   = now_ms;
    action.ttl_deadline_ms = now_ms + static_cast<uint64_t>(ttl_ms.count());
    action.created_by      = actor.id;
    ThrowIfDbError(repository_->InsertAction(tx, action), "enqueue action for " + device_id);

    transitions.push_back(
        audit_->Record(tx, SUBJECT_TYPE_ACTION, std::to_string(action.action_id), model::kNoState, model::Name(ACTION_STATUS_PENDING), actor));
    return action;
  });

  audit_->Announce(transitions);
  return ToAction(record);
}

std::optional<db::model::ActionRecord> ActionQueue::ClaimNextInTransaction(db::Transaction& tx, const std::string& device_id, util::TimePoint now,
                                                                           std::vector<db::model::AuditRecord>& transitions) {
  const auto now_ms = util::ToUnixMillis(now);

  // At most one outstanding command per device; a Delivered one blocks
  // delivery until it is completed or reaped.
  db::ActionFilter in_flight;
  in_flight.device_id = device_id;
  in_flight.statuses  = {ACTION_STATUS_DELIVERED};
  in_flight.limit     = 1;
  if (!repository_->ListActions(tx, in_flight).empty()) {
    return std::nullopt;
  }

  db::ActionFilter next;
  next.device_id              = device_id;
  next.statuses               = {ACTION_STATUS_PENDING};
  next.deadline_not_before_ms = now_ms;
  next.limit                  = 1;
  auto candidates             = repository_->ListActions(tx, next);
  if (candidates.empty()) {
    return std::nullopt;
  }

  auto action            = candidates.front();
  action.status          = ACTION_STATUS_DELIVERED;
  action.delivered_at_ms = now_ms;
  ThrowIfDbError(repository_->UpdateAction(tx, action, ACTION_STATUS_PENDING), "deliver " + ActionLabel(action.action_id));
  transitions.push_back(audit_->Record(tx, SUBJECT_TYPE_ACTION, std::to_string(action.action_id), model::Name(ACTION_STATUS_PENDING),
                                       model::Name(ACTION_STATUS_DELIVERED), Actor::Device(device_id)));
  return action;
}

std::optional<Action> ActionQueue::NextPending(const std::string& device_id) {
  std::vector<db::model::AuditRecord> transitions;
  auto claimed = RunInTransaction(*repository_, "action.next_pending", [&](db::Transaction& tx) {
    transitions.clear();

    auto device = repository_->LockDevice(tx, device_id);
    if (!device) {
      throw util::UnknownDevice("unknown device " + device_id);
    }
    if (device->adoption_state != ADOPTION_STATE_APPROVED) {
      throw util::Unauthorized("device " + device_id + " is " + std::string(model::Name(device->adoption_state)));
    }
    return ClaimNextInTransaction(tx, device_id, clock_->Now(), transitions);
  });

  audit_->Announce(transitions);
  if (!claimed) {
    return std::nullopt;
  }
  return ToAction(*claimed);
}

Action ActionQueue::Complete(uint64_t action_id, const google::protobuf::Struct& result, bool success, const std::string& reporting_device) {
  const auto to          = success ? ACTION_STATUS_COMPLETED : ACTION_STATUS_FAILED;
  const auto result_json = util::ToJson(result);

  std::vector<db::model::AuditRecord> transitions;
  auto record = RunInTransaction(*repository_, "action.complete", [&](db::Transaction& tx) {
    transitions.clear();

    auto action = LoadAction(tx, action_id);
    if (!reporting_device.empty()) {
      auto device = repository_->GetDevice(tx, reporting_device);
      if (!device || device->adoption_state != ADOPTION_STATE_APPROVED) {
        throw util::Unauthorized("device " + reporting_device + " is not approved");
      }
      if (action.device_id != reporting_device) {
        throw util::Unauthorized(ActionLabel(action_id) + " is not held by " + reporting_device);
      }
    }
    // A result after expiry is discarded, not re-queued.
    if (action.status != ACTION_STATUS_DELIVERED) {
      throw util::InvalidStateTransition(ActionLabel(action_id) + " is " + std::string(model::Name(action.status)) + ", not delivered");
    }

    const auto from        = action.status;
    action.status          = to;
    action.completed_at_ms = util::ToUnixMillis(clock_->Now());
    action.result_json     = result_json;
    ThrowIfDbError(repository_->UpdateAction(tx, action, from), "complete " + ActionLabel(action_id));
    transitions.push_back(audit_->Record(tx, SUBJECT_TYPE_ACTION, std::to_string(action_id), model::Name(from), model::Name(to),
                                         Actor::Device(action.device_id)));
    return action;
  });

  audit_->Announce(transitions);
  return ToAction(record);
}

Action ActionQueue::Cancel(uint64_t action_id, const std::string& administrator) {
  const auto actor = Actor::Administrator(administrator);

  std::vector<db::model::AuditRecord> transitions;
  auto record = RunInTransaction(*repository_, "action.cancel", [&](db::Transaction& tx) {
    transitions.clear();

    auto action = LoadAction(tx, action_id);
    RequireTransition(action, ACTION_STATUS_EXPIRED);

    const auto from = action.status;
    action.status   = ACTION_STATUS_EXPIRED;
    ThrowIfDbError(repository_->UpdateAction(tx, action, from), "cancel " + ActionLabel(action_id));
    transitions.push_back(audit_->Record(tx, SUBJECT_TYPE_ACTION, std::to_string(action_id), model::Name(from),
                                         model::Name(ACTION_STATUS_EXPIRED), actor, "cancelled"));
    return action;
  });

  audit_->Announce(transitions);
  return ToAction(record);
}

Action ActionQueue::UpdateTtl(uint64_t action_id, std::chrono::seconds ttl, const std::string& administrator) {
  const auto ttl_ms = ResolveTtl(ttl);

  auto record = RunInTransaction(*repository_, "action.update_ttl", [&](db::Transaction& tx) {
    auto action = LoadAction(tx, action_id);
    if (model::IsTerminal(action.status)) {
      throw util::InvalidStateTransition(ActionLabel(action_id) + " is " + std::string(model::Name(action.status)));
    }

    action.ttl_deadline_ms = util::ToUnixMillis(clock_->Now()) + static_cast<uint64_t>(ttl_ms.count());
    ThrowIfDbError(repository_->UpdateAction(tx, action, action.status), "update ttl of " + ActionLabel(action_id));
    return action;
  });

  FLEET_LOG_INFO("action ttl updated", {observability::IntField("action_id", static_cast<int64_t>(action_id)),
                                        observability::IntField("ttl_ms", ttl_ms.count()),
                                        observability::StringField("actor", Actor::Administrator(administrator).id)});
  return ToAction(record);
}

int64_t ActionQueue::RemainingTtlSeconds(uint64_t action_id) {
  auto action = RunInTransaction(*repository_, "action.ttl", [&](db::Transaction& tx) { return LoadAction(tx, action_id); });
  if (model::IsTerminal(action.status)) {
    return 0;
  }
  const auto now_ms = util::ToUnixMillis(clock_->Now());
  if (action.ttl_deadline_ms <= now_ms) {
    return 0;
  }
  return static_cast<int64_t>((action.ttl_deadline_ms - now_ms) / 1000);
}

Action ActionQueue::Get(uint64_t action_id) {
  return ToAction(RunInTransaction(*repository_, "action.get", [&](db::Transaction& tx) { return LoadAction(tx, action_id); }));
}

std::vector<Action> ActionQueue::List(const ActionListQuery& query) {
  db::ActionFilter filter;
  filter.device_id = query.device_id;
  if (query.status) {
    filter.statuses = {*query.status};
  }
  filter.limit  = query.limit == 0 ? kDefaultListLimit : std::min(query.limit, kMaxListLimit);
  filter.offset = query.offset;

  auto records = RunInTransaction(*repository_, "action.list", [&](db::Transaction& tx) { return repository_->ListActions(tx, filter); });

  std::vector<Action> actions;
  actions.reserve(records.size());
  for (const auto& record : records) {
    actions.push_back(ToAction(record));
  }
  return actions;
}

} // namespace fleet::core
