#include "pg_repository.hpp"

#include <cstdint>
#include <string>

#include "internal/db/api/errors.hpp"
#include "internal/model/audit_vocabulary.hpp"
#include "internal/model/state_machine.hpp"

namespace fleet::db::postgres {

using fleet::coordinator::core::v1::ActionStatus;
using fleet::coordinator::core::v1::AdoptionState;

namespace {

constexpr const char* kDeviceColumns = "device_id,adoption_state,registered_at_ms,last_seen_at_ms,system_info";

constexpr const char* kActionColumns =
    "action_id,device_id,spec,status,created_at_ms,ttl_deadline_ms,delivered_at_ms,completed_at_ms,result,created_by";

// Held until commit so audit entry ids become visible in id order.
constexpr const char* kLockAuditAppend = "SELECT pg_advisory_xact_lock(7305901234)";

constexpr const char* kAuditColumns = "entry_id,timestamp_ms,subject_type,subject_id,from_state,to_state,actor_type,actor_id,details";

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::string Text(std::string_view v) {
  return std::string(v);
}

model::DeviceRecord ReadDevice(const pqxx::row& row) {
  model::DeviceRecord r;
  r.device_id        = row[0].c_str();
  r.adoption_state   = fleet::model::ParseAdoptionState(row[1].c_str());
  r.registered_at_ms = row[2].as<uint64_t>();
  r.last_seen_at_ms  = row[3].as<uint64_t>();
  r.system_info_json = row[4].c_str();
  return r;
}

model::ActionRecord ReadAction(const pqxx::row& row) {
  model::ActionRecord r;
  r.action_id       = row[0].as<uint64_t>();
  r.device_id       = row[1].c_str();
  r.spec_json       = row[2].c_str();
  r.status          = fleet::model::ParseActionStatus(row[3].c_str());
  r.created_at_ms   = row[4].as<uint64_t>();
  r.ttl_deadline_ms = row[5].as<uint64_t>();
  r.delivered_at_ms = row[6].as<uint64_t>();
  r.completed_at_ms = row[7].as<uint64_t>();
  r.result_json     = row[8].c_str();
  r.created_by      = row[9].c_str();
  return r;
}

model::AuditRecord ReadAudit(const pqxx::row& row) {
  model::AuditRecord r;
  r.entry_id     = row[0].as<uint64_t>();
  r.timestamp_ms = row[1].as<uint64_t>();
  r.subject_type = fleet::model::ParseSubjectType(row[2].c_str());
  r.subject_id   = row[3].c_str();
  r.from_state   = row[4].c_str();
  r.to_state     = row[5].c_str();
  r.actor_type   = fleet::model::ParseActorType(row[6].c_str());
  r.actor_id     = row[7].c_str();
  r.details      = row[8].c_str();
  return r;
}

// Placeholder for the parameter appended last.
std::string Next(pqxx::params& params) {
  return "$" + std::to_string(params.size());
}

// WHERE clause shared by ListDevices and CountDevices.
std::string DeviceWhere(const DeviceFilter& filter, pqxx::params& params) {
  std::string where = " WHERE TRUE";
  if (filter.state) {
    params.append(Text(fleet::model::Name(*filter.state)));
    where += " AND adoption_state=" + Next(params);
  }
  if (filter.registered_before_ms) {
    params.append(I64(*filter.registered_before_ms));
    where += " AND registered_at_ms<" + Next(params);
  }
  if (filter.seen_since_ms) {
    params.append(I64(*filter.seen_since_ms));
    where += " AND last_seen_at_ms>=" + Next(params);
  }
  return where;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result PgRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    // ON CONFLICT keeps the transaction usable after a duplicate id.
    auto res = TX(t).Work().exec_prepared("insert_device", r.device_id, Text(fleet::model::Name(r.adoption_state)), I64(r.registered_at_ms),
                                          I64(r.last_seen_at_ms), r.system_info_json);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::AlreadyExists, "device " + r.device_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeviceRecord> PgRepository::GetDevice(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_device", id);
    if (res.empty()) return std::nullopt;
    return ReadDevice(res[0]);
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

std::optional<model::DeviceRecord> PgRepository::LockDevice(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("lock_device", id);
    if (res.empty()) return std::nullopt;
    return ReadDevice(res[0]);
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

Result PgRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r, AdoptionState expected_state) {
  try {
    auto res = TX(t).Work().exec_prepared("update_device", r.device_id, Text(fleet::model::Name(r.adoption_state)), I64(r.last_seen_at_ms),
                                          r.system_info_json, Text(fleet::model::Name(expected_state)));
    if (res.affected_rows() == 0) {
      if (!GetDevice(t, r.device_id)) return Result::Err(ErrorCode::NotFound, "device " + r.device_id);
      return Result::Err(ErrorCode::Conflict, "device " + r.device_id + " changed state");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DeviceRecord> PgRepository::ListDevices(Transaction& t, const DeviceFilter& filter) {
  pqxx::params params;
  std::string  sql = std::string("SELECT ") + kDeviceColumns + " FROM devices" + DeviceWhere(filter, params);
  sql += " ORDER BY device_id ASC";
  if (filter.limit > 0) {
    params.append(static_cast<int64_t>(filter.limit));
    sql += " LIMIT " + Next(params);
  }

  try {
    auto                             res = TX(t).Work().exec_params(sql, params);
    std::vector<model::DeviceRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadDevice(row));
    }
    return out;
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

uint64_t PgRepository::CountDevices(Transaction& t, const DeviceFilter& filter) {
  pqxx::params params;
  const auto   sql = "SELECT COUNT(*) FROM devices" + DeviceWhere(filter, params);
  try {
    auto res = TX(t).Work().exec_params(sql, params);
    return res[0][0].as<uint64_t>();
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

std::map<AdoptionState, uint64_t> PgRepository::CountDevicesByState(Transaction& t) {
  try {
    auto res = TX(t).Work().exec("SELECT adoption_state,COUNT(*) FROM devices GROUP BY adoption_state;");

    std::map<AdoptionState, uint64_t> counts;
    for (const auto& row : res) {
      counts[fleet::model::ParseAdoptionState(row[0].c_str())] = row[1].as<uint64_t>();
    }
    return counts;
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

// ------------------------------------------------------------------
// Actions
// ------------------------------------------------------------------

Result PgRepository::InsertAction(Transaction& t, model::ActionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_action", r.device_id, r.spec_json, Text(fleet::model::Name(r.status)), I64(r.created_at_ms),
                                          I64(r.ttl_deadline_ms), I64(r.delivered_at_ms), I64(r.completed_at_ms), r.result_json, r.created_by);
    r.action_id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ActionRecord> PgRepository::GetAction(Transaction& t, uint64_t action_id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_action", I64(action_id));
    if (res.empty()) return std::nullopt;
    return ReadAction(res[0]);
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

Result PgRepository::UpdateAction(Transaction& t, const model::ActionRecord& r, ActionStatus expected_status) {
  try {
    auto res = TX(t).Work().exec_prepared("update_action", I64(r.action_id), Text(fleet::model::Name(r.status)), I64(r.ttl_deadline_ms),
                                          I64(r.delivered_at_ms), I64(r.completed_at_ms), r.result_json,
                                          Text(fleet::model::Name(expected_status)));
    if (res.affected_rows() == 0) {
      if (!GetAction(t, r.action_id)) return Result::Err(ErrorCode::NotFound, "action " + std::to_string(r.action_id));
      return Result::Err(ErrorCode::Conflict, "action " + std::to_string(r.action_id) + " changed status");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ActionRecord> PgRepository::ListActions(Transaction& t, const ActionFilter& filter) {
  pqxx::params params;
  std::string  sql = std::string("SELECT ") + kActionColumns + " FROM actions WHERE TRUE";
  if (filter.device_id) {
    params.append(*filter.device_id);
    sql += " AND device_id=" + Next(params);
  }
  if (!filter.statuses.empty()) {
    sql += " AND status IN (";
    for (std::size_t i = 0; i < filter.statuses.size(); ++i) {
      params.append(Text(fleet::model::Name(filter.statuses[i])));
      sql += (i == 0 ? "" : ",") + Next(params);
    }
    sql += ")";
  }
  if (filter.deadline_before_ms) {
    params.append(I64(*filter.deadline_before_ms));
    sql += " AND ttl_deadline_ms<" + Next(params);
  }
  if (filter.deadline_not_before_ms) {
    params.append(I64(*filter.deadline_not_before_ms));
    sql += " AND ttl_deadline_ms>=" + Next(params);
  }
  sql += " ORDER BY created_at_ms ASC, action_id ASC";
  if (filter.limit > 0) {
    params.append(static_cast<int64_t>(filter.limit));
    sql += " LIMIT " + Next(params);
  }
  if (filter.offset > 0) {
    params.append(static_cast<int64_t>(filter.offset));
    sql += " OFFSET " + Next(params);
  }

  try {
    auto                             res = TX(t).Work().exec_params(sql, params);
    std::vector<model::ActionRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadAction(row));
    }
    return out;
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

std::map<ActionStatus, uint64_t> PgRepository::CountActionsByStatus(Transaction& t) {
  try {
    auto res = TX(t).Work().exec("SELECT status,COUNT(*) FROM actions GROUP BY status;");

    std::map<ActionStatus, uint64_t> counts;
    for (const auto& row : res) {
      counts[fleet::model::ParseActionStatus(row[0].c_str())] = row[1].as<uint64_t>();
    }
    return counts;
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::AppendAudit(Transaction& t, model::AuditRecord& r) {
  try {
    TX(t).Work().exec(kLockAuditAppend);
    auto res = TX(t).Work().exec_prepared("insert_audit", I64(r.timestamp_ms), Text(fleet::model::Name(r.subject_type)), r.subject_id, r.from_state,
                                          r.to_state, Text(fleet::model::Name(r.actor_type)), r.actor_id, r.details);
    r.entry_id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuditRecord> PgRepository::ListAudit(Transaction& t, const AuditFilter& filter) {
  pqxx::params params;
  params.append(I64(filter.after_entry_id));
  std::string sql = std::string("SELECT ") + kAuditColumns + " FROM audit_log WHERE entry_id>" + Next(params);
  if (filter.subject_type) {
    params.append(Text(fleet::model::Name(*filter.subject_type)));
    sql += " AND subject_type=" + Next(params);
  }
  if (filter.subject_id) {
    params.append(*filter.subject_id);
    sql += " AND subject_id=" + Next(params);
  }
  sql += filter.newest_first ? " ORDER BY entry_id DESC" : " ORDER BY entry_id ASC";
  if (filter.limit > 0) {
    params.append(static_cast<int64_t>(filter.limit));
    sql += " LIMIT " + Next(params);
  }

  try {
    auto                            res = TX(t).Work().exec_params(sql, params);
    std::vector<model::AuditRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadAudit(row));
    }
    return out;
  } catch (const pqxx::failure& e) {
    RethrowAsStorageError(e);
  }
}

} // namespace fleet::db::postgres
