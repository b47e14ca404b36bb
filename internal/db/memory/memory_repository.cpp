#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace fleet::db::memory {

using fleet::coordinator::core::v1::ActionStatus;
using fleet::coordinator::core::v1::AdoptionState;

namespace {

bool DeviceMatches(const DeviceFilter& filter, const model::DeviceRecord& r) {
  if (filter.state && r.adoption_state != *filter.state) return false;
  if (filter.registered_before_ms && !(r.registered_at_ms < *filter.registered_before_ms)) return false;
  if (filter.seen_since_ms && r.last_seen_at_ms < *filter.seen_since_ms) return false;
  return true;
}

bool StatusMatches(const ActionFilter& filter, ActionStatus status) {
  return filter.statuses.empty() || std::find(filter.statuses.begin(), filter.statuses.end(), status) != filter.statuses.end();
}

bool ActionMatches(const ActionFilter& filter, const model::ActionRecord& r) {
  if (filter.device_id && r.device_id != *filter.device_id) return false;
  if (!StatusMatches(filter, r.status)) return false;
  if (filter.deadline_before_ms && !(r.ttl_deadline_ms < *filter.deadline_before_ms)) return false;
  if (filter.deadline_not_before_ms && r.ttl_deadline_ms < *filter.deadline_not_before_ms) return false;
  return true;
}

bool AuditMatches(const AuditFilter& filter, const model::AuditRecord& r) {
  if (r.entry_id <= filter.after_entry_id) return false;
  if (filter.subject_type && r.subject_type != *filter.subject_type) return false;
  if (filter.subject_id && r.subject_id != *filter.subject_id) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result MemoryRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.devices.contains(r.device_id)) return Result::Err(ErrorCode::AlreadyExists, "device " + r.device_id);
  s.devices[r.device_id] = r;
  return Result::Ok();
}

std::optional<model::DeviceRecord> MemoryRepository::GetDevice(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.devices.find(id);
  if (it == s.devices.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DeviceRecord> MemoryRepository::LockDevice(Transaction& t, const std::string& id) {
  // The commit-time version check already serializes writers.
  return GetDevice(t, id);
}

Result MemoryRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r, AdoptionState expected_state) {
  auto& s  = TX(t).Mutable();
  auto  it = s.devices.find(r.device_id);
  if (it == s.devices.end()) return Result::Err(ErrorCode::NotFound, "device " + r.device_id);
  if (it->second.adoption_state != expected_state) return Result::Err(ErrorCode::Conflict, "device " + r.device_id + " changed state");

  auto& row            = it->second;
  row.adoption_state   = r.adoption_state;
  row.last_seen_at_ms  = r.last_seen_at_ms;
  row.system_info_json = r.system_info_json;
  return Result::Ok();
}

std::vector<model::DeviceRecord> MemoryRepository::ListDevices(Transaction& t, const DeviceFilter& filter) {
  std::vector<model::DeviceRecord> out;
  for (const auto& [_, r] : TX(t).View().devices) {
    if (!DeviceMatches(filter, r)) continue;
    out.push_back(r);
    if (filter.limit > 0 && out.size() >= filter.limit) break;
  }
  return out;
}

uint64_t MemoryRepository::CountDevices(Transaction& t, const DeviceFilter& filter) {
  uint64_t count = 0;
  for (const auto& [_, r] : TX(t).View().devices) {
    if (DeviceMatches(filter, r)) ++count;
  }
  return count;
}

std::map<AdoptionState, uint64_t> MemoryRepository::CountDevicesByState(Transaction& t) {
  std::map<AdoptionState, uint64_t> counts;
  for (const auto& [_, r] : TX(t).View().devices) {
    ++counts[r.adoption_state];
  }
  return counts;
}

// ------------------------------------------------------------------
// Actions
// ------------------------------------------------------------------

Result MemoryRepository::InsertAction(Transaction& t, model::ActionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.devices.contains(r.device_id)) return Result::Err(ErrorCode::ConstraintViolation, "device " + r.device_id);

  r.action_id            = s.next_action_id++;
  s.actions[r.action_id] = r;
  return Result::Ok();
}

std::optional<model::ActionRecord> MemoryRepository::GetAction(Transaction& t, uint64_t action_id) {
  const auto& s  = TX(t).View();
  auto        it = s.actions.find(action_id);
  if (it == s.actions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateAction(Transaction& t, const model::ActionRecord& r, ActionStatus expected_status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.actions.find(r.action_id);
  if (it == s.actions.end()) return Result::Err(ErrorCode::NotFound, "action " + std::to_string(r.action_id));
  if (it->second.status != expected_status) {
    return Result::Err(ErrorCode::Conflict, "action " + std::to_string(r.action_id) + " changed status");
  }

  auto& row           = it->second;
  row.status          = r.status;
  row.ttl_deadline_ms = r.ttl_deadline_ms;
  row.delivered_at_ms = r.delivered_at_ms;
  row.completed_at_ms = r.completed_at_ms;
  row.result_json     = r.result_json;
  return Result::Ok();
}

std::vector<model::ActionRecord> MemoryRepository::ListActions(Transaction& t, const ActionFilter& filter) {
  std::vector<model::ActionRecord> matched;
  for (const auto& [_, r] : TX(t).View().actions) {
    if (ActionMatches(filter, r)) matched.push_back(r);
  }

  std::stable_sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.action_id < b.action_id;
  });

  if (filter.offset >= matched.size()) return {};
  auto first = matched.begin() + static_cast<std::ptrdiff_t>(filter.offset);
  auto last  = matched.end();
  if (filter.limit > 0 && static_cast<std::size_t>(last - first) > filter.limit) {
    last = first + static_cast<std::ptrdiff_t>(filter.limit);
  }
  return std::vector<model::ActionRecord>(first, last);
}

std::map<ActionStatus, uint64_t> MemoryRepository::CountActionsByStatus(Transaction& t) {
  std::map<ActionStatus, uint64_t> counts;
  for (const auto& [_, r] : TX(t).View().actions) {
    ++counts[r.status];
  }
  return counts;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::AppendAudit(Transaction& t, model::AuditRecord& r) {
  auto& s    = TX(t).Mutable();
  r.entry_id = s.next_entry_id++;
  s.audit.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAudit(Transaction& t, const AuditFilter& filter) {
  const auto&                     audit = TX(t).View().audit;
  std::vector<model::AuditRecord> out;

  auto take = [&](const model::AuditRecord& r) {
    if (!AuditMatches(filter, r)) return true;
    out.push_back(r);
    return filter.limit == 0 || out.size() < filter.limit;
  };

  if (filter.newest_first) {
    for (auto it = audit.rbegin(); it != audit.rend(); ++it) {
      if (!take(*it)) break;
    }
  } else {
    for (const auto& r : audit) {
      if (!take(r)) break;
    }
  }
  return out;
}

} // namespace fleet::db::memory
