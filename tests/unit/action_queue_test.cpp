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

google::protobuf::Struct Result(const std::string& output) {
  google::protobuf::Struct result;
  (*result.mutable_fields())["output"].set_string_value(output);
  return result;
}

void TestEnqueueRequiresApprovedDevice() {
  TestFleet fleet;
  ExpectThrows<fleet::util::UnknownDevice>([&] { fleet.Enqueue("ghost", "reboot"); });

  fleet.ctx.registry->RegisterOrGreet("edge-01", nullptr);
  ExpectThrows<fleet::util::UnknownDevice>([&] { fleet.Enqueue("edge-01", "reboot"); });

  fleet.ctx.registry->Decide("edge-01", ADOPTION_DECISION_APPROVE, "ops");
  const auto action = fleet.Enqueue("edge-01", "reboot");
  assert(action.action_id() > 0);
  assert(action.status() == ACTION_STATUS_PENDING);
  assert(action.created_by() == "ops");
  assert(action.spec().fields().at("command").string_value() == "reboot");

  fleet.ctx.registry->Decide("edge-01", ADOPTION_DECISION_REVOKE, "ops");
  ExpectThrows<fleet::util::UnknownDevice>([&] { fleet.Enqueue("edge-01", "reboot"); });
}

void TestTtlDefaultsAndClamping() {
  fleet::core::FleetPolicy policy;
  policy.default_action_ttl = 3600s;
  policy.max_action_ttl     = 7200s;
  TestFleet fleet(std::make_shared<fleet::db::memory::MemoryRepository>(), policy);
  fleet.Adopt("edge-01");

  const auto by_default = fleet.Enqueue("edge-01", "a");
  assert(by_default.ttl_deadline().seconds() - by_default.created_at().seconds() == 3600);

  const auto clamped = fleet.Enqueue("edge-01", "b", std::chrono::seconds(99999));
  assert(clamped.ttl_deadline().seconds() - clamped.created_at().seconds() == 7200);

  ExpectThrows<fleet::util::InvalidArgument>([&] { fleet.Enqueue("edge-01", "c", std::chrono::seconds(-1)); });

  assert(fleet.ctx.queue->RemainingTtlSeconds(by_default.action_id()) == 3600);
  fleet.clock->Advance(600s);
  assert(fleet.ctx.queue->RemainingTtlSeconds(by_default.action_id()) == 3000);
}

void TestDeliveryIsFifoOneAtATime() {
  TestFleet fleet;
  fleet.Adopt("edge-01");

  const auto first = fleet.Enqueue("edge-01", "first");
  fleet.clock->Advance(1s);
  const auto second = fleet.Enqueue("edge-01", "second");

  auto claimed = fleet.ctx.queue->NextPending("edge-01");
  assert(claimed && claimed->action_id() == first.action_id());
  assert(claimed->status() == ACTION_STATUS_DELIVERED);
  assert(claimed->has_delivered_at());

  // The delivered action blocks the next one until it reports.
  assert(!fleet.ctx.queue->NextPending("edge-01"));

  const auto done = fleet.ctx.queue->Complete(first.action_id(), Result("ok"), true, "edge-01");
  assert(done.status() == ACTION_STATUS_COMPLETED);
  assert(done.result().fields().at("output").string_value() == "ok");
  assert(done.has_completed_at());

  claimed = fleet.ctx.queue->NextPending("edge-01");
  assert(claimed && claimed->action_id() == second.action_id());

  const auto failed = fleet.ctx.queue->Complete(second.action_id(), Result("exit 1"), false, "edge-01");
  assert(failed.status() == ACTION_STATUS_FAILED);
  assert(!fleet.ctx.queue->NextPending("edge-01"));
}

void TestNextPendingSkipsOverdueActions() {
  TestFleet fleet;
  fleet.Adopt("edge-01");

  const auto stale = fleet.Enqueue("edge-01", "stale", 10s);
  fleet.clock->Advance(5s);
  const auto fresh = fleet.Enqueue("edge-01", "fresh", 3600s);
  fleet.clock->Advance(10s);

  auto claimed = fleet.ctx.queue->NextPending("edge-01");
  assert(claimed && claimed->action_id() == fresh.action_id());
  assert(fleet.ctx.queue->Get(stale.action_id()).status() == ACTION_STATUS_PENDING);
}

void TestNextPendingRequiresApproval() {
  TestFleet fleet;
  ExpectThrows<fleet::util::UnknownDevice>([&] { fleet.ctx.queue->NextPending("ghost"); });

  fleet.ctx.registry->RegisterOrGreet("edge-01", nullptr);
  ExpectThrows<fleet::util::Unauthorized>([&] { fleet.ctx.queue->NextPending("edge-01"); });
}

void TestCompletionRules() {
  TestFleet fleet;
  fleet.Adopt("edge-01");
  fleet.Adopt("edge-02");

  const auto action = fleet.Enqueue("edge-01", "reboot");
  ExpectThrows<fleet::util::NotFound>([&] { fleet.ctx.queue->Complete(9999, Result("x"), true, "edge-01"); });

  // Not yet delivered.
  ExpectThrows<fleet::util::InvalidStateTransition>([&] { fleet.ctx.queue->Complete(action.action_id(), Result("x"), true, "edge-01"); });

  fleet.ctx.queue->NextPending("edge-01");

  // Another device may not report for it; an unknown reporter is refused too.
  ExpectThrows<fleet::util::Unauthorized>([&] { fleet.ctx.queue->Complete(action.action_id(), Result("x"), true, "edge-02"); });
  ExpectThrows<fleet::util::Unauthorized>([&] { fleet.ctx.queue->Complete(action.action_id(), Result("x"), true, "ghost"); });

  fleet.ctx.queue->Complete(action.action_id(), Result("x"), true, "edge-01");

  // Terminal: a second report is an error and changes nothing.
  ExpectThrows<fleet::util::InvalidStateTransition>([&] { fleet.ctx.queue->Complete(action.action_id(), Result("y"), false, "edge-01"); });
  assert(fleet.ctx.queue->Get(action.action_id()).status() == ACTION_STATUS_COMPLETED);
}

void TestRevokedDeviceCannotReport() {
  TestFleet fleet;
  fleet.Adopt("edge-01");
  const auto action = fleet.Enqueue("edge-01", "reboot");
  fleet.ctx.queue->NextPending("edge-01");

  fleet.ctx.registry->Decide("edge-01", ADOPTION_DECISION_REVOKE, "ops");
  ExpectThrows<fleet::util::Unauthorized>([&] { fleet.ctx.queue->Complete(action.action_id(), Result("x"), true, "edge-01"); });
  assert(fleet.ctx.queue->Get(action.action_id()).status() == ACTION_STATUS_DELIVERED);
}

void TestCancelAndTtlUpdate() {
  TestFleet fleet;
  fleet.Adopt("edge-01");

  const auto action = fleet.Enqueue("edge-01", "update", 60s);

  fleet.clock->Advance(30s);
  const auto extended = fleet.ctx.queue->UpdateTtl(action.action_id(), 600s, "ops");
  assert(extended.status() == ACTION_STATUS_PENDING);
  assert(fleet.ctx.queue->RemainingTtlSeconds(action.action_id()) == 600);

  const auto cancelled = fleet.ctx.queue->Cancel(action.action_id(), "bob");
  assert(cancelled.status() == ACTION_STATUS_EXPIRED);
  assert(fleet.ctx.queue->RemainingTtlSeconds(action.action_id()) == 0);

  ExpectThrows<fleet::util::InvalidStateTransition>([&] { fleet.ctx.queue->Cancel(action.action_id(), "bob"); });
  ExpectThrows<fleet::util::InvalidStateTransition>([&] { fleet.ctx.queue->UpdateTtl(action.action_id(), 60s, "bob"); });
  ExpectThrows<fleet::util::NotFound>([&] { fleet.ctx.queue->Cancel(424242, "bob"); });

  fleet::core::AuditQuery query;
  query.subject_type = SUBJECT_TYPE_ACTION;
  query.subject_id   = std::to_string(action.action_id());
  const auto audit   = fleet.ctx.audit->Query(query);
  assert(audit.size() == 2);
  assert(audit[1].to_state() == "expired");
  assert(audit[1].details() == "cancelled");
  assert(audit[1].actor().id() == "bob");
}

void TestListFiltersAndPages() {
  TestFleet fleet;
  fleet.Adopt("edge-01");
  fleet.Adopt("edge-02");

  for (int i = 0; i < 5; ++i) {
    fleet.Enqueue("edge-01", "cmd-" + std::to_string(i));
    fleet.clock->Advance(1s);
  }
  fleet.Enqueue("edge-02", "other");
  fleet.ctx.queue->NextPending("edge-01");

  fleet::core::ActionListQuery query;
  query.device_id = "edge-01";
  assert(fleet.ctx.queue->List(query).size() == 5);

  query.status = ACTION_STATUS_PENDING;
  assert(fleet.ctx.queue->List(query).size() == 4);

  query.status = std::nullopt;
  query.limit  = 2;
  query.offset = 1;
  const auto page = fleet.ctx.queue->List(query);
  assert(page.size() == 2);
  assert(page[0].spec().fields().at("command").string_value() == "cmd-1");
  assert(page[1].spec().fields().at("command").string_value() == "cmd-2");

  assert(fleet.ctx.queue->List({}).size() == 6);
}

} // namespace

int main() {
  TestEnqueueRequiresApprovedDevice();
  TestTtlDefaultsAndClamping();
  TestDeliveryIsFifoOneAtATime();
  TestNextPendingSkipsOverdueActions();
  TestNextPendingRequiresApproval();
  TestCompletionRules();
  TestRevokedDeviceCannotReport();
  TestCancelAndTtlUpdate();
  TestListFiltersAndPages();

  std::cout << "fleet_unit_action_queue: pass\n";
  return 0;
}
