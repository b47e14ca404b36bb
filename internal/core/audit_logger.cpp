#include "audit_logger.hpp"

#include <algorithm>

#include "internal/core/conversions.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/model/audit_vocabulary.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace fleet::core {

using namespace fleet::coordinator::core::v1;

Actor Actor::Device(const std::string& device_id) {
  return {ACTOR_TYPE_DEVICE, device_id};
}

Actor Actor::Reaper() {
  return {ACTOR_TYPE_REAPER, "reaper"};
}

Actor Actor::Administrator(const std::string& name) {
  return {ACTOR_TYPE_ADMINISTRATOR, name.empty() ? std::string(kDefaultAdministrator) : name};
}

AuditLogger::AuditLogger(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, FleetPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), policy_(policy) {
}

db::model::AuditRecord AuditLogger::Record(db::Transaction& tx, SubjectType subject_type, const std::string& subject_id,
                                           std::string_view from_state, std::string_view to_state, const Actor& actor, std::string details) {
  db::model::AuditRecord record;
  record.timestamp_ms = util::ToUnixMillis(clock_->Now());
  record.subject_type = subject_type;
  record.subject_id   = subject_id;
  record.from_state   = std::string(from_state);
  record.to_state     = std::string(to_state);
  record.actor_type   = actor.type;
  record.actor_id     = actor.id;
  record.details      = std::move(details);

  ThrowIfDbError(repository_->AppendAudit(tx, record), "audit " + std::string(model::Name(subject_type)) + " " + subject_id);
  return record;
}

void AuditLogger::Announce(const std::vector<db::model::AuditRecord>& records) const {
  for (const auto& record : records) {
    FLEET_LOG_INFO("state transition", {observability::StringField("subject", model::Name(record.subject_type)),
                                         observability::StringField("id", record.subject_id), observability::StringField("from", record.from_state),
                                         observability::StringField("to", record.to_state),
                                         observability::StringField("actor", std::string(model::Name(record.actor_type)) + ":" + record.actor_id),
                                         observability::IntField("entry_id", static_cast<int64_t>(record.entry_id))});
    observability::Metrics::Instance().RecordTransition(model::Name(record.subject_type), record.to_state);
  }
}

std::vector<AuditEntry> AuditLogger::Query(const AuditQuery& query) {
  db::AuditFilter filter;
  filter.subject_type   = query.subject_type;
  filter.subject_id     = query.subject_id;
  filter.after_entry_id = query.after_entry_id;
  filter.limit          = query.limit == 0 ? kDefaultQueryLimit : std::min(query.limit, kMaxQueryLimit);
  filter.newest_first   = query.newest_first;

  auto records = RunInTransaction(*repository_, "audit.query", [&](db::Transaction& tx) { return repository_->ListAudit(tx, filter); });

  std::vector<AuditEntry> entries;
  entries.reserve(records.size());
  for (const auto& record : records) {
    entries.push_back(ToAuditEntry(record));
  }
  return entries;
}

std::vector<AuditEntry> AuditLogger::History(std::size_t limit) {
  db::AuditFilter filter;
  filter.limit        = limit == 0 ? kHistoryLimit : std::min(limit, kHistoryLimit);
  filter.newest_first = true;

  auto records = RunInTransaction(*repository_, "audit.history", [&](db::Transaction& tx) { return repository_->ListAudit(tx, filter); });

  std::vector<AuditEntry> entries;
  entries.reserve(records.size());
  for (const auto& record : records) {
    entries.push_back(ToAuditEntry(record));
  }
  return entries;
}

FleetSummary AuditLogger::Summary() {
  return RunInTransaction(*repository_, "fleet.summary", [&](db::Transaction& tx) {
    FleetSummary summary;
    summary.devices_by_state  = repository_->CountDevicesByState(tx);
    summary.actions_by_status = repository_->CountActionsByStatus(tx);
    for (const auto& [state, count] : summary.devices_by_state) {
      summary.devices_total += count;
    }

    db::DeviceFilter online;
    online.seen_since_ms   = OnlineSinceMs(clock_->Now(), policy_.offline_threshold);
    summary.devices_online = repository_->CountDevices(tx, online);
    return summary;
  });
}

} // namespace fleet::core
