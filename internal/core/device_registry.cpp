#include "device_registry.hpp"

#include <algorithm>

#include "internal/core/conversions.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleet::core {

using namespace fleet::coordinator::core::v1;

namespace {

constexpr std::size_t kMaxDeviceIdLength = 128;

bool IsDeviceIdChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == ':' || c == '-';
}

} // namespace

DeviceRegistry::DeviceRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<AuditLogger> audit,
                               FleetPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), audit_(std::move(audit)), policy_(policy) {
}

void DeviceRegistry::ValidateDeviceId(const std::string& device_id) {
  if (device_id.empty() || device_id.size() > kMaxDeviceIdLength) {
    throw util::InvalidArgument("device_id must be 1 to 128 characters");
  }
  for (char c : device_id) {
    if (!IsDeviceIdChar(c)) {
      throw util::InvalidArgument("device_id contains an invalid character: " + device_id);
    }
  }
}

Device DeviceRegistry::RegisterOrGreet(const std::string& device_id, const SystemInfo* system_info) {
  ValidateDeviceId(device_id);

  std::vector<db::model::AuditRecord> transitions;
  util::TimePoint                     now;
  auto record = RunInTransaction(*repository_, "device.register", [&](db::Transaction& tx) {
    transitions.clear();
    now = clock_->Now();
    return GreetInTransaction(tx, device_id, system_info, now, transitions);
  });

  audit_->Announce(transitions);
  return View(record, now);
}

db::model::DeviceRecord DeviceRegistry::GreetInTransaction(db::Transaction& tx, const std::string& device_id, const SystemInfo* system_info,
                                                           util::TimePoint now, std::vector<db::model::AuditRecord>& transitions) {
  const auto now_ms = util::ToUnixMillis(now);

  auto existing = repository_->LockDevice(tx, device_id);
  if (!existing) {
    db::model::DeviceRecord record;
    record.device_id        = device_id;
    record.adoption_state   = ADOPTION_STATE_PENDING;
    record.registered_at_ms = now_ms;
    record.last_seen_at_ms  = now_ms;
    if (system_info) {
      record.system_info_json = util::ToJson(*system_info);
    }

    // A concurrent first contact surfaces as AlreadyExists and is retried,
    // after which this device is simply greeted.
    ThrowIfDbError(repository_->InsertDevice(tx, record), "register device " + device_id);
    transitions.push_back(
        audit_->Record(tx, SUBJECT_TYPE_DEVICE, device_id, model::kNoState, model::Name(ADOPTION_STATE_PENDING), Actor::Device(device_id)));
    return record;
  }

  auto record = *existing;
  if (model::IsTerminal(record.adoption_state)) {
    throw util::Unauthorized("device " + device_id + " is " + std::string(model::Name(record.adoption_state)));
  }

  record.last_seen_at_ms = std::max(record.last_seen_at_ms, now_ms);
  if (system_info) {
    record.system_info_json = util::ToJson(*system_info);
  }
  ThrowIfDbError(repository_->UpdateDevice(tx, record, existing->adoption_state), "greet device " + device_id);
  return record;
}

Device DeviceRegistry::Decide(const std::string& device_id, AdoptionDecision decision, const std::string& administrator) {
  const auto target = model::TargetState(decision);
  if (target == ADOPTION_STATE_UNSPECIFIED) {
    throw util::InvalidArgument("unknown adoption decision");
  }
  const auto actor = Actor::Administrator(administrator);

  std::vector<db::model::AuditRecord> transitions;
  util::TimePoint                     now;
  auto record = RunInTransaction(*repository_, "device.decide", [&](db::Transaction& tx) {
    transitions.clear();
    now = clock_->Now();

    auto existing = repository_->LockDevice(tx, device_id);
    if (!existing) {
      throw util::UnknownDevice("unknown device " + device_id);
    }
    const auto from = existing->adoption_state;
    if (!model::CanTransition(from, target)) {
      throw util::InvalidStateTransition("device " + device_id + ": " + std::string(model::Name(from)) + " -> " +
                                         std::string(model::Name(target)) + " is not allowed");
    }

    auto updated           = *existing;
    updated.adoption_state = target;
    ThrowIfDbError(repository_->UpdateDevice(tx, updated, from), "decide device " + device_id);
    transitions.push_back(audit_->Record(tx, SUBJECT_TYPE_DEVICE, device_id, model::Name(from), model::Name(target), actor));
    return updated;
  });

  audit_->Announce(transitions);
  return View(record, now);
}

Device DeviceRegistry::Get(const std::string& device_id) {
  auto record = RunInTransaction(*repository_, "device.get", [&](db::Transaction& tx) { return repository_->GetDevice(tx, device_id); });
  if (!record) {
    throw util::UnknownDevice("unknown device " + device_id);
  }
  return View(*record, clock_->Now());
}

std::vector<Device> DeviceRegistry::List(std::optional<AdoptionState> state, std::optional<bool> online) {
  db::DeviceFilter filter;
  filter.state = state;

  auto records = RunInTransaction(*repository_, "device.list", [&](db::Transaction& tx) { return repository_->ListDevices(tx, filter); });

  const auto          now = clock_->Now();
  std::vector<Device> devices;
  devices.reserve(records.size());
  for (const auto& record : records) {
    auto device = View(record, now);
    if (online && device.online() != *online) {
      continue;
    }
    devices.push_back(std::move(device));
  }
  return devices;
}

Device DeviceRegistry::View(const db::model::DeviceRecord& record, util::TimePoint now) const {
  return ToDevice(record, now, policy_.offline_threshold);
}

} // namespace fleet::core
