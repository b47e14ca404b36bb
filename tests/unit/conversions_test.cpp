#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/core/conversions.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using namespace fleet::coordinator::core::v1;
using fleet::core::IsOnline;
using fleet::core::OnlineSinceMs;
using fleet::util::FromUnixMillis;

constexpr uint64_t kLastSeenMs = 1'700'000'000'000;

fleet::db::model::DeviceRecord SeenAt(uint64_t last_seen_ms) {
  fleet::db::model::DeviceRecord record;
  record.device_id        = "edge-01";
  record.adoption_state   = ADOPTION_STATE_APPROVED;
  record.registered_at_ms = kLastSeenMs - 1000;
  record.last_seen_at_ms  = last_seen_ms;
  return record;
}

void TestOnlineIsStrictlyBelowThreshold() {
  const auto record = SeenAt(kLastSeenMs);

  assert(IsOnline(record, FromUnixMillis(kLastSeenMs), 90s));
  assert(IsOnline(record, FromUnixMillis(kLastSeenMs + 89'999), 90s));
  assert(!IsOnline(record, FromUnixMillis(kLastSeenMs + 90'000), 90s));
  assert(!IsOnline(record, FromUnixMillis(kLastSeenMs + 600'000), 90s));
}

void TestNeverSeenIsOffline() {
  assert(!IsOnline(SeenAt(0), FromUnixMillis(kLastSeenMs), 90s));
}

void TestClockBehindLastSeenCountsAsOnline() {
  assert(IsOnline(SeenAt(kLastSeenMs), FromUnixMillis(kLastSeenMs - 5000), 90s));
}

void TestOnlineSinceMatchesIsOnline() {
  const auto now = FromUnixMillis(kLastSeenMs + 90'000);
  assert(OnlineSinceMs(now, 90s) == kLastSeenMs + 1);
  assert(!IsOnline(SeenAt(kLastSeenMs), now, 90s));
  assert(IsOnline(SeenAt(kLastSeenMs + 1), now, 90s));

  // Early clocks clamp to 1 so never-seen devices stay offline.
  assert(OnlineSinceMs(FromUnixMillis(1000), 90s) == 1);
  assert(OnlineSinceMs(FromUnixMillis(kLastSeenMs), 0ms) == kLastSeenMs);
  assert(IsOnline(SeenAt(kLastSeenMs), FromUnixMillis(kLastSeenMs), 0ms));
}

void TestDeviceViewCarriesSystemInfo() {
  SystemInfo info;
  info.set_hostname("edge-01.local");
  info.set_cpu_count(4);

  auto record             = SeenAt(kLastSeenMs);
  record.system_info_json = fleet::util::ToJson(info);

  const auto device = fleet::core::ToDevice(record, FromUnixMillis(kLastSeenMs + 1000), 90s);
  assert(device.device_id() == "edge-01");
  assert(device.adoption_state() == ADOPTION_STATE_APPROVED);
  assert(device.online());
  assert(device.system_info().hostname() == "edge-01.local");
  assert(device.system_info().cpu_count() == 4);
  assert(fleet::util::ToUnixMillis(fleet::util::FromProto(device.last_seen_at())) == kLastSeenMs);
}

void TestCorruptStoredJsonDoesNotThrow() {
  auto record             = SeenAt(kLastSeenMs);
  record.system_info_json = "{not json";

  const auto device = fleet::core::ToDevice(record, FromUnixMillis(kLastSeenMs), 90s);
  assert(device.device_id() == "edge-01");
  assert(device.system_info().hostname().empty());
}

void TestActionViewLeavesUnsetTimestampsEmpty() {
  fleet::db::model::ActionRecord record;
  record.action_id       = 7;
  record.device_id       = "edge-01";
  record.spec_json       = R"({"command":"reboot"})";
  record.status          = ACTION_STATUS_PENDING;
  record.created_at_ms   = kLastSeenMs;
  record.ttl_deadline_ms = kLastSeenMs + 3'600'000;
  record.created_by      = "ops";

  const auto action = fleet::core::ToAction(record);
  assert(action.action_id() == 7);
  assert(action.spec().fields().at("command").string_value() == "reboot");
  assert(!action.has_delivered_at());
  assert(!action.has_completed_at());
  assert(action.created_by() == "ops");
}

} // namespace

int main() {
  TestOnlineIsStrictlyBelowThreshold();
  TestNeverSeenIsOffline();
  TestClockBehindLastSeenCountsAsOnline();
  TestOnlineSinceMatchesIsOnline();
  TestDeviceViewCarriesSystemInfo();
  TestCorruptStoredJsonDoesNotThrow();
  TestActionViewLeavesUnsetTimestampsEmpty();

  std::cout << "fleet_unit_conversions: pass\n";
  return 0;
}
