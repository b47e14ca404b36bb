#include "conversions.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleet::core {

using namespace fleet::coordinator::core::v1;

namespace {

// Stored blobs were written by us; a row that no longer parses is reported
// but does not make the whole device/action unreadable.
void ParseStoredJson(const std::string& json, google::protobuf::Message* message, const std::string& what) {
  if (json.empty()) {
    return;
  }
  try {
    util::ParseJson(json, message, what, /*ignore_unknown_fields=*/true);
  } catch (const util::InvalidArgument& e) {
    FLEET_LOG_WARN("stored JSON does not parse", {observability::StringField("field", what), observability::StringField("error", e.what())});
  }
}

} // namespace

uint64_t OnlineSinceMs(util::TimePoint now, std::chrono::milliseconds offline_threshold) {
  const auto now_ms    = util::ToUnixMillis(now);
  const auto threshold = offline_threshold.count() > 0 ? static_cast<uint64_t>(offline_threshold.count()) : 0;
  // Online while now - last_seen < threshold; a zero threshold still accepts last_seen >= now.
  uint64_t since = now_ms;
  if (threshold > 0) {
    since = now_ms >= threshold ? now_ms - threshold + 1 : 0;
  }
  return since == 0 ? 1 : since;
}

bool IsOnline(const db::model::DeviceRecord& record, util::TimePoint now, std::chrono::milliseconds offline_threshold) {
  return record.last_seen_at_ms >= OnlineSinceMs(now, offline_threshold);
}

Device ToDevice(const db::model::DeviceRecord& record, util::TimePoint now, std::chrono::milliseconds offline_threshold) {
  Device device;
  device.set_device_id(record.device_id);
  device.set_adoption_state(record.adoption_state);
  *device.mutable_registered_at() = util::MillisToProto(record.registered_at_ms);
  if (record.last_seen_at_ms > 0) {
    *device.mutable_last_seen_at() = util::MillisToProto(record.last_seen_at_ms);
  }
  device.set_online(IsOnline(record, now, offline_threshold));
  ParseStoredJson(record.system_info_json, device.mutable_system_info(), "device.system_info");
  return device;
}

Action ToAction(const db::model::ActionRecord& record) {
  Action action;
  action.set_action_id(record.action_id);
  action.set_device_id(record.device_id);
  ParseStoredJson(record.spec_json, action.mutable_spec(), "action.spec");
  action.set_status(record.status);
  *action.mutable_created_at()   = util::MillisToProto(record.created_at_ms);
  *action.mutable_ttl_deadline() = util::MillisToProto(record.ttl_deadline_ms);
  if (record.delivered_at_ms > 0) {
    *action.mutable_delivered_at() = util::MillisToProto(record.delivered_at_ms);
  }
  if (record.completed_at_ms > 0) {
    *action.mutable_completed_at() = util::MillisToProto(record.completed_at_ms);
  }
  ParseStoredJson(record.result_json, action.mutable_result(), "action.result");
  action.set_created_by(record.created_by);
  return action;
}

AuditEntry ToAuditEntry(const db::model::AuditRecord& record) {
  AuditEntry entry;
  entry.set_entry_id(record.entry_id);
  *entry.mutable_timestamp() = util::MillisToProto(record.timestamp_ms);
  entry.set_subject_type(record.subject_type);
  entry.set_subject_id(record.subject_id);
  entry.set_from_state(record.from_state);
  entry.set_to_state(record.to_state);
  entry.mutable_actor()->set_type(record.actor_type);
  entry.mutable_actor()->set_id(record.actor_id);
  entry.set_details(record.details);
  return entry;
}

} // namespace fleet::core
