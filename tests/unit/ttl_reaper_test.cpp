#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "support/test_fleet.hpp"

namespace {

using namespace std::chrono_literals;
using namespace fleet::coordinator::core::v1;
using fleet::testing::TestFleet;

template <typename Exception, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool thrown = false;
  try {
    fn();
  } catch (const Exception&) {
    thrown = true;
  }
  assert(thrown);
}

std::size_t AuditCount(TestFleet& fleet, SubjectType type, const std::string& id) {
  fleet::core::AuditQuery query;
  query.subject_type = type;
  query.subject_id   = id;
  return fleet.ctx.audit->Query(query).size();
}

void TestOverduePendingActionExpires() {
  TestFleet fleet;
  fleet.Adopt("d1");

  const auto a2 = fleet.Enqueue("d1", "stale", 1s);
  fleet.clock->Advance(2s);

  const auto report = fleet.ctx.reaper->Sweep();
  assert(report.expired_actions == 1);
  assert(report.expired_count() == 1);

  assert(fleet.ctx.queue->Get(a2.action_id()).status() == ACTION_STATUS_EXPIRED);

  fleet::core::AuditQuery query;
  query.subject_type = SUBJECT_TYPE_ACTION;
  query.subject_id   = std::to_string(a2.action_id());
  const auto audit   = fleet.ctx.audit->Query(query);
  assert(audit.size() == 2);
  assert(audit[1].from_state() == "pending");
  assert(audit[1].to_state() == "expired");
  assert(audit[1].actor().type() == ACTOR_TYPE_REAPER);

  assert(!fleet.ctx.queue->NextPending("d1"));
  assert(!fleet.ctx.heartbeat->Heartbeat("d1", nullptr).next_action);
}

void TestSweepIsIdempotent() {
  TestFleet fleet;
  fleet.Adopt("d1");
  const auto action = fleet.Enqueue("d1", "stale", 1s);
  fleet.clock->Advance(5s);

  assert(fleet.ctx.reaper->Sweep().expired_count() == 1);
  const auto audit_after_first = AuditCount(fleet, SUBJECT_TYPE_ACTION, std::to_string(action.action_id()));

  const auto second = fleet.ctx.reaper->Sweep();
  assert(second.expired_count() == 0);
  assert(AuditCount(fleet, SUBJECT_TYPE_ACTION, std::to_string(action.action_id())) == audit_after_first);
  assert(fleet.ctx.queue->Get(action.action_id()).status() == ACTION_STATUS_EXPIRED);
}

void TestDeadlineBoundaryIsExclusive() {
  TestFleet fleet;
  fleet.Adopt("d1");
  const auto action = fleet.Enqueue("d1", "edge", 10s);

  fleet.clock->Advance(10s);
  assert(fleet.ctx.reaper->Sweep().expired_actions == 0);

  fleet.clock->Advance(1ms);
  assert(fleet.ctx.reaper->Sweep().expired_actions == 1);
  assert(fleet.ctx.queue->Get(action.action_id()).status() == ACTION_STATUS_EXPIRED);
}

void TestDeliveredActionExpiresAndLateResultIsRefused() {
  TestFleet fleet;
  fleet.Adopt("d1");
  const auto action = fleet.Enqueue("d1", "slow", 60s);
  fleet.ctx.heartbeat->Heartbeat("d1", nullptr);

  fleet.clock->Advance(61s);
  assert(fleet.ctx.reaper->Sweep().expired_actions == 1);

  google::protobuf::Struct result;
  ExpectThrows<fleet::util::InvalidStateTransition>([&] { fleet.ctx.queue->Complete(action.action_id(), result, true, "d1"); });
  assert(fleet.ctx.queue->Get(action.action_id()).status() == ACTION_STATUS_EXPIRED);

  // The slot is free again for the next action.
  const auto next = fleet.Enqueue("d1", "next");
  const auto beat = fleet.ctx.heartbeat->Heartbeat("d1", nullptr);
  assert(beat.next_action && beat.next_action->action_id() == next.action_id());
}

void TestCompletedActionsAreLeftAlone() {
  TestFleet fleet;
  fleet.Adopt("d1");
  const auto action = fleet.Enqueue("d1", "quick", 5s);
  fleet.ctx.heartbeat->Heartbeat("d1", nullptr);
  fleet.ctx.queue->Complete(action.action_id(), google::protobuf::Struct{}, true, "d1");

  fleet.clock->Advance(1h);
  assert(fleet.ctx.reaper->Sweep().expired_count() == 0);
  assert(fleet.ctx.queue->Get(action.action_id()).status() == ACTION_STATUS_COMPLETED);
}

void TestExtendedTtlSurvivesSweep() {
  TestFleet fleet;
  fleet.Adopt("d1");
  const auto action = fleet.Enqueue("d1", "long", 10s);

  fleet.clock->Advance(8s);
  fleet.ctx.queue->UpdateTtl(action.action_id(), 60s, "ops");
  fleet.clock->Advance(8s);

  assert(fleet.ctx.reaper->Sweep().expired_actions == 0);
  assert(fleet.ctx.queue->Get(action.action_id()).status() == ACTION_STATUS_PENDING);
}

void TestStalePendingDevicesAreRejected() {
  fleet::core::FleetPolicy policy;
  policy.pending_adoption_ttl = 1h;
  TestFleet fleet(std::make_shared<fleet::db::memory::MemoryRepository>(), policy);

  fleet.ctx.registry->RegisterOrGreet("old", nullptr);
  fleet.Adopt("approved");
  fleet.clock->Advance(50min);
  fleet.ctx.registry->RegisterOrGreet("young", nullptr);
  fleet.clock->Advance(11min);

  const auto report = fleet.ctx.reaper->Sweep();
  assert(report.rejected_devices == 1);
  assert(fleet.ctx.registry->Get("old").adoption_state() == ADOPTION_STATE_REJECTED);
  assert(fleet.ctx.registry->Get("young").adoption_state() == ADOPTION_STATE_PENDING);
  assert(fleet.ctx.registry->Get("approved").adoption_state() == ADOPTION_STATE_APPROVED);

  fleet::core::AuditQuery query;
  query.subject_id = "old";
  const auto audit = fleet.ctx.audit->Query(query);
  assert(audit.back().to_state() == "rejected");
  assert(audit.back().actor().type() == ACTOR_TYPE_REAPER);
  assert(audit.back().details() == "pending adoption expired");

  ExpectThrows<fleet::util::Unauthorized>([&] { fleet.ctx.heartbeat->Heartbeat("old", nullptr); });
  assert(fleet.ctx.reaper->Sweep().rejected_devices == 0);
}

void TestZeroPendingTtlDisablesAutoReject() {
  fleet::core::FleetPolicy policy;
  policy.pending_adoption_ttl = 0ms;
  TestFleet fleet(std::make_shared<fleet::db::memory::MemoryRepository>(), policy);

  fleet.ctx.registry->RegisterOrGreet("old", nullptr);
  fleet.clock->Advance(24h * 30);
  assert(fleet.ctx.reaper->Sweep().rejected_devices == 0);
  assert(fleet.ctx.registry->Get("old").adoption_state() == ADOPTION_STATE_PENDING);
}

void TestBatchSizeBoundsOneSweep() {
  fleet::core::ReaperOptions options;
  options.batch_size = 2;
  TestFleet fleet(std::make_shared<fleet::db::memory::MemoryRepository>(), {}, options);
  fleet.Adopt("d1");
  for (int i = 0; i < 5; ++i) {
    fleet.Enqueue("d1", "cmd-" + std::to_string(i), 1s);
  }
  fleet.clock->Advance(2s);

  assert(fleet.ctx.reaper->Sweep().expired_actions == 2);
  assert(fleet.ctx.reaper->Sweep().expired_actions == 2);
  assert(fleet.ctx.reaper->Sweep().expired_actions == 1);
  assert(fleet.ctx.reaper->Sweep().expired_actions == 0);
}

} // namespace

int main() {
  TestOverduePendingActionExpires();
  TestSweepIsIdempotent();
  TestDeadlineBoundaryIsExclusive();
  TestDeliveredActionExpiresAndLateResultIsRefused();
  TestCompletedActionsAreLeftAlone();
  TestExtendedTtlSurvivesSweep();
  TestStalePendingDevicesAreRejected();
  TestZeroPendingTtlDisablesAutoReject();
  TestBatchSizeBoundsOneSweep();

  std::cout << "fleet_unit_ttl_reaper: pass\n";
  return 0;
}
