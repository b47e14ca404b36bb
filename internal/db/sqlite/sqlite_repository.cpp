#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/db/api/errors.hpp"
#include "internal/model/audit_vocabulary.hpp"
#include "internal/model/state_machine.hpp"

namespace fleet::db::sqlite {

using fleet::coordinator::core::v1::ActionStatus;
using fleet::coordinator::core::v1::AdoptionState;

namespace {

// Owns one prepared statement.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }

  sqlite3_stmt* get() const {
    return st_;
  }

  // Reads cannot report a Result; a broken statement is a storage error.
  sqlite3_stmt* OrThrow() const {
    if (!st_) throw StorageError(ErrorCode::InternalError, std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    return st_;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

using BindValue = std::variant<std::string, int64_t>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindAll(sqlite3_stmt* st, const std::vector<BindValue>& values) {
  int idx = 1;
  for (const auto& v : values) {
    if (const auto* s = std::get_if<std::string>(&v)) {
      BindText(st, idx++, *s);
    } else {
      sqlite3_bind_int64(st, idx++, std::get<int64_t>(v));
    }
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Row stepping for reads: SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  if ((rc & 0xff) == SQLITE_BUSY || (rc & 0xff) == SQLITE_LOCKED) {
    throw TransactionConflict(sqlite3_errmsg(db));
  }
  throw StorageError(ErrorCode::InternalError, std::string("sqlite step: ") + sqlite3_errmsg(db));
}

constexpr const char* kDeviceColumns = "device_id,adoption_state,registered_at_ms,last_seen_at_ms,system_info";

constexpr const char* kActionColumns =
    "action_id,device_id,spec,status,created_at_ms,ttl_deadline_ms,delivered_at_ms,completed_at_ms,result,created_by";

constexpr const char* kAuditColumns = "entry_id,timestamp_ms,subject_type,subject_id,from_state,to_state,actor_type,actor_id,details";

model::DeviceRecord ReadDevice(sqlite3_stmt* st) {
  model::DeviceRecord r;
  r.device_id        = ColText(st, 0);
  r.adoption_state   = fleet::model::ParseAdoptionState(ColText(st, 1));
  r.registered_at_ms = ColU64(st, 2);
  r.last_seen_at_ms  = ColU64(st, 3);
  r.system_info_json = ColText(st, 4);
  return r;
}

model::ActionRecord ReadAction(sqlite3_stmt* st) {
  model::ActionRecord r;
  r.action_id       = ColU64(st, 0);
  r.device_id       = ColText(st, 1);
  r.spec_json       = ColText(st, 2);
  r.status          = fleet::model::ParseActionStatus(ColText(st, 3));
  r.created_at_ms   = ColU64(st, 4);
  r.ttl_deadline_ms = ColU64(st, 5);
  r.delivered_at_ms = ColU64(st, 6);
  r.completed_at_ms = ColU64(st, 7);
  r.result_json     = ColText(st, 8);
  r.created_by      = ColText(st, 9);
  return r;
}

// WHERE clause shared by ListDevices and CountDevices.
std::string DeviceWhere(const DeviceFilter& filter, std::vector<BindValue>& binds) {
  std::string where = " WHERE 1=1";
  if (filter.state) {
    where += " AND adoption_state=?";
    binds.emplace_back(std::string(fleet::model::Name(*filter.state)));
  }
  if (filter.registered_before_ms) {
    where += " AND registered_at_ms<?";
    binds.emplace_back(static_cast<int64_t>(*filter.registered_before_ms));
  }
  if (filter.seen_since_ms) {
    where += " AND last_seen_at_ms>=?";
    binds.emplace_back(static_cast<int64_t>(*filter.seen_since_ms));
  }
  return where;
}

model::AuditRecord ReadAudit(sqlite3_stmt* st) {
  model::AuditRecord r;
  r.entry_id     = ColU64(st, 0);
  r.timestamp_ms = ColU64(st, 1);
  r.subject_type = fleet::model::ParseSubjectType(ColText(st, 2));
  r.subject_id   = ColText(st, 3);
  r.from_state   = ColText(st, 4);
  r.to_state     = ColText(st, 5);
  r.actor_type   = fleet::model::ParseActorType(ColText(st, 6));
  r.actor_id     = ColText(st, 7);
  r.details      = ColText(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result SqliteRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO devices(device_id,adoption_state,registered_at_ms,last_seen_at_ms,system_info) "
        "VALUES(?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.device_id);
    BindText(st.get(), 2, fleet::model::Name(r.adoption_state));
    BindU64(st.get(), 3, r.registered_at_ms);
    BindU64(st.get(), 4, r.last_seen_at_ms);
    BindText(st.get(), 5, r.system_info_json);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DeviceRecord> SqliteRepository::GetDevice(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kDeviceColumns + " FROM devices WHERE device_id=?;");
    BindText(st.OrThrow(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadDevice(st.get());
}

std::optional<model::DeviceRecord> SqliteRepository::LockDevice(Transaction& t, const std::string& id) {
    // BEGIN IMMEDIATE already holds the database write lock.
    return GetDevice(t, id);
}

Result SqliteRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r, AdoptionState expected_state) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "UPDATE devices SET adoption_state=?,last_seen_at_ms=?,system_info=? "
        "WHERE device_id=? AND adoption_state=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, fleet::model::Name(r.adoption_state));
    BindU64(st.get(), 2, r.last_seen_at_ms);
    BindText(st.get(), 3, r.system_info_json);
    BindText(st.get(), 4, r.device_id);
    BindText(st.get(), 5, fleet::model::Name(expected_state));

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) {
        if (!GetDevice(t, r.device_id)) return Result::Err(ErrorCode::NotFound, "device " + r.device_id);
        return Result::Err(ErrorCode::Conflict, "device " + r.device_id + " changed state");
    }
    return Result::Ok();
}

std::vector<model::DeviceRecord> SqliteRepository::ListDevices(Transaction& t, const DeviceFilter& filter) {
    auto* db = TX(t).Handle();

    std::vector<BindValue> binds;
    std::string            sql = std::string("SELECT ") + kDeviceColumns + " FROM devices" + DeviceWhere(filter, binds);
    sql += " ORDER BY device_id ASC";
    if (filter.limit > 0) {
        sql += " LIMIT ?";
        binds.emplace_back(static_cast<int64_t>(filter.limit));
    }
    sql += ";";

    Statement st(db, sql);
    BindAll(st.OrThrow(), binds);

    std::vector<model::DeviceRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadDevice(st.get()));
    }
    return out;
}

uint64_t SqliteRepository::CountDevices(Transaction& t, const DeviceFilter& filter) {
    auto* db = TX(t).Handle();

    std::vector<BindValue> binds;
    Statement              st(db, "SELECT COUNT(*) FROM devices" + DeviceWhere(filter, binds) + ";");
    BindAll(st.OrThrow(), binds);

    uint64_t count = 0;
    if (StepRow(db, st.get())) {
        count = ColU64(st.get(), 0);
    }
    return count;
}

std::map<AdoptionState, uint64_t> SqliteRepository::CountDevicesByState(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT adoption_state,COUNT(*) FROM devices GROUP BY adoption_state;");
    st.OrThrow();

    std::map<AdoptionState, uint64_t> counts;
    while (StepRow(db, st.get())) {
        counts[fleet::model::ParseAdoptionState(ColText(st.get(), 0))] = ColU64(st.get(), 1);
    }
    return counts;
}

// ------------------------------------------------------------------
// Actions
// ------------------------------------------------------------------

Result SqliteRepository::InsertAction(Transaction& t, model::ActionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO actions(device_id,spec,status,created_at_ms,ttl_deadline_ms,delivered_at_ms,completed_at_ms,result,created_by) "
        "VALUES(?,?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.device_id);
    BindText(st.get(), 2, r.spec_json);
    BindText(st.get(), 3, fleet::model::Name(r.status));
    BindU64(st.get(), 4, r.created_at_ms);
    BindU64(st.get(), 5, r.ttl_deadline_ms);
    BindU64(st.get(), 6, r.delivered_at_ms);
    BindU64(st.get(), 7, r.completed_at_ms);
    BindText(st.get(), 8, r.result_json);
    BindText(st.get(), 9, r.created_by);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }

    r.action_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::ActionRecord> SqliteRepository::GetAction(Transaction& t, uint64_t action_id) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kActionColumns + " FROM actions WHERE action_id=?;");
    BindU64(st.OrThrow(), 1, action_id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadAction(st.get());
}

Result SqliteRepository::UpdateAction(Transaction& t, const model::ActionRecord& r, ActionStatus expected_status) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "UPDATE actions SET status=?,ttl_deadline_ms=?,delivered_at_ms=?,completed_at_ms=?,result=? "
        "WHERE action_id=? AND status=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, fleet::model::Name(r.status));
    BindU64(st.get(), 2, r.ttl_deadline_ms);
    BindU64(st.get(), 3, r.delivered_at_ms);
    BindU64(st.get(), 4, r.completed_at_ms);
    BindText(st.get(), 5, r.result_json);
    BindU64(st.get(), 6, r.action_id);
    BindText(st.get(), 7, fleet::model::Name(expected_status));

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) {
        if (!GetAction(t, r.action_id)) return Result::Err(ErrorCode::NotFound, "action " + std::to_string(r.action_id));
        return Result::Err(ErrorCode::Conflict, "action " + std::to_string(r.action_id) + " changed status");
    }
    return Result::Ok();
}

std::vector<model::ActionRecord> SqliteRepository::ListActions(Transaction& t, const ActionFilter& filter) {
    auto* db = TX(t).Handle();

    std::string            sql = std::string("SELECT ") + kActionColumns + " FROM actions WHERE 1=1";
    std::vector<BindValue> binds;
    if (filter.device_id) {
        sql += " AND device_id=?";
        binds.emplace_back(*filter.device_id);
    }
    if (!filter.statuses.empty()) {
        sql += " AND status IN (";
        for (std::size_t i = 0; i < filter.statuses.size(); ++i) {
            sql += i == 0 ? "?" : ",?";
            binds.emplace_back(std::string(fleet::model::Name(filter.statuses[i])));
        }
        sql += ")";
    }
    if (filter.deadline_before_ms) {
        sql += " AND ttl_deadline_ms<?";
        binds.emplace_back(static_cast<int64_t>(*filter.deadline_before_ms));
    }
    if (filter.deadline_not_before_ms) {
        sql += " AND ttl_deadline_ms>=?";
        binds.emplace_back(static_cast<int64_t>(*filter.deadline_not_before_ms));
    }
    sql += " ORDER BY created_at_ms ASC, action_id ASC";
    if (filter.limit > 0 || filter.offset > 0) {
        // sqlite needs a LIMIT for OFFSET; -1 means unbounded
        sql += " LIMIT ? OFFSET ?";
        binds.emplace_back(filter.limit > 0 ? static_cast<int64_t>(filter.limit) : int64_t{-1});
        binds.emplace_back(static_cast<int64_t>(filter.offset));
    }
    sql += ";";

    Statement st(db, sql);
    BindAll(st.OrThrow(), binds);

    std::vector<model::ActionRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadAction(st.get()));
    }
    return out;
}

std::map<ActionStatus, uint64_t> SqliteRepository::CountActionsByStatus(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT status,COUNT(*) FROM actions GROUP BY status;");
    st.OrThrow();

    std::map<ActionStatus, uint64_t> counts;
    while (StepRow(db, st.get())) {
        counts[fleet::model::ParseActionStatus(ColText(st.get(), 0))] = ColU64(st.get(), 1);
    }
    return counts;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendAudit(Transaction& t, model::AuditRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO audit_log(timestamp_ms,subject_type,subject_id,from_state,to_state,actor_type,actor_id,details) "
        "VALUES(?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, r.timestamp_ms);
    BindText(st.get(), 2, fleet::model::Name(r.subject_type));
    BindText(st.get(), 3, r.subject_id);
    BindText(st.get(), 4, r.from_state);
    BindText(st.get(), 5, r.to_state);
    BindText(st.get(), 6, fleet::model::Name(r.actor_type));
    BindText(st.get(), 7, r.actor_id);
    BindText(st.get(), 8, r.details);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }

    r.entry_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::AuditRecord> SqliteRepository::ListAudit(Transaction& t, const AuditFilter& filter) {
    auto* db = TX(t).Handle();

    std::string            sql = std::string("SELECT ") + kAuditColumns + " FROM audit_log WHERE entry_id>?";
    std::vector<BindValue> binds;
    binds.emplace_back(static_cast<int64_t>(filter.after_entry_id));
    if (filter.subject_type) {
        sql += " AND subject_type=?";
        binds.emplace_back(std::string(fleet::model::Name(*filter.subject_type)));
    }
    if (filter.subject_id) {
        sql += " AND subject_id=?";
        binds.emplace_back(*filter.subject_id);
    }
    sql += filter.newest_first ? " ORDER BY entry_id DESC" : " ORDER BY entry_id ASC";
    if (filter.limit > 0) {
        sql += " LIMIT ?";
        binds.emplace_back(static_cast<int64_t>(filter.limit));
    }
    sql += ";";

    Statement st(db, sql);
    BindAll(st.OrThrow(), binds);

    std::vector<model::AuditRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadAudit(st.get()));
    }
    return out;
}

} // namespace fleet::db::sqlite
