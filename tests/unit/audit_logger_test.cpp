#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "support/test_fleet.hpp"

namespace {

using namespace std::chrono_literals;
using namespace fleet::coordinator::core::v1;
using fleet::db::ErrorCode;
using fleet::db::Result;
using fleet::testing::HookedRepository;
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

struct HookedFleet {
  std::shared_ptr<HookedRepository> hooked = std::make_shared<HookedRepository>(std::make_shared<fleet::db::memory::MemoryRepository>());
  TestFleet                         fleet;

  explicit HookedFleet(fleet::core::FleetPolicy policy = {}) : fleet(hooked, policy) {
  }
};

Result InjectedIoError() {
  return Result::Err(ErrorCode::IOError, "injected audit failure");
}

void TestFailedAuditRollsBackRegistration() {
  HookedFleet h;
  h.hooked->on_append_audit = InjectedIoError;

  ExpectThrows<fleet::util::StorageFailure>([&] { h.fleet.ctx.registry->RegisterOrGreet("d1", nullptr); });

  h.hooked->on_append_audit = nullptr;
  ExpectThrows<fleet::util::UnknownDevice>([&] { h.fleet.ctx.registry->Get("d1"); });
  assert(h.fleet.ctx.audit->Query({}).empty());
}

void TestFailedAuditRollsBackDecision() {
  HookedFleet h;
  h.fleet.ctx.registry->RegisterOrGreet("d1", nullptr);

  h.hooked->on_append_audit = InjectedIoError;
  ExpectThrows<fleet::util::StorageFailure>([&] { h.fleet.ctx.registry->Decide("d1", ADOPTION_DECISION_APPROVE, "ops"); });
  h.hooked->on_append_audit = nullptr;

  assert(h.fleet.ctx.registry->Get("d1").adoption_state() == ADOPTION_STATE_PENDING);
  assert(h.fleet.ctx.audit->Query({}).size() == 1);

  // Nothing was half-applied, so the decision can be made again.
  h.fleet.ctx.registry->Decide("d1", ADOPTION_DECISION_APPROVE, "ops");
  assert(h.fleet.ctx.audit->Query({}).size() == 2);
}

void TestFailedAuditRollsBackWholeHeartbeat() {
  HookedFleet h;
  h.fleet.Adopt("d1");
  const auto action = h.fleet.Enqueue("d1", "reboot");
  const auto before = h.fleet.ctx.registry->Get("d1");

  h.fleet.clock->Advance(60s);
  h.hooked->on_append_audit = InjectedIoError;
  ExpectThrows<fleet::util::StorageFailure>([&] { h.fleet.ctx.heartbeat->Heartbeat("d1", nullptr); });
  h.hooked->on_append_audit = nullptr;

  // Neither the claim nor the greeting committed.
  assert(h.fleet.ctx.queue->Get(action.action_id()).status() == ACTION_STATUS_PENDING);
  assert(h.fleet.ctx.registry->Get("d1").last_seen_at().seconds() == before.last_seen_at().seconds());
}

void TestFailedAuditRollsBackReaperExpiry() {
  HookedFleet h;
  h.fleet.Adopt("d1");
  h.fleet.Adopt("d2");
  const auto stuck = h.fleet.Enqueue("d1", "stale", 1s);
  const auto next  = h.fleet.Enqueue("d2", "stale", 2s);
  h.fleet.clock->Advance(10s);

  // Only the oldest overdue row's audit append fails.
  int appends               = 0;
  h.hooked->on_append_audit = [&] { return ++appends == 1 ? InjectedIoError() : Result::Ok(); };
  const auto report         = h.fleet.ctx.reaper->Sweep();
  h.hooked->on_append_audit = nullptr;

  assert(report.expired_actions == 1);
  assert(h.fleet.ctx.queue->Get(stuck.action_id()).status() == ACTION_STATUS_PENDING);
  assert(h.fleet.ctx.queue->Get(next.action_id()).status() == ACTION_STATUS_EXPIRED);

  assert(h.fleet.ctx.reaper->Sweep().expired_actions == 1);
  assert(h.fleet.ctx.queue->Get(stuck.action_id()).status() == ACTION_STATUS_EXPIRED);
}

void TestFailedAuditSkipsOneStaleDevice() {
  fleet::core::FleetPolicy policy;
  policy.pending_adoption_ttl = std::chrono::hours(1);
  HookedFleet h(policy);
  h.fleet.ctx.registry->RegisterOrGreet("old-1", nullptr);
  h.fleet.ctx.registry->RegisterOrGreet("old-2", nullptr);
  h.fleet.clock->Advance(std::chrono::hours(2));

  int appends               = 0;
  h.hooked->on_append_audit = [&] { return ++appends == 1 ? InjectedIoError() : Result::Ok(); };
  const auto report         = h.fleet.ctx.reaper->Sweep();
  h.hooked->on_append_audit = nullptr;

  assert(report.rejected_devices == 1);
  assert(h.fleet.ctx.registry->Get("old-1").adoption_state() == ADOPTION_STATE_PENDING);
  assert(h.fleet.ctx.registry->Get("old-2").adoption_state() == ADOPTION_STATE_REJECTED);
}

void TestCommitFailureLeavesNoTrace() {
  HookedFleet h;
  h.fleet.Adopt("d1");
  const auto audit_before = h.fleet.ctx.audit->Query({}).size();

  h.hooked->fail_commit = [] { return true; };
  ExpectThrows<fleet::util::StorageFailure>([&] { h.fleet.Enqueue("d1", "reboot"); });
  h.hooked->fail_commit = nullptr;

  assert(h.fleet.ctx.queue->List({}).empty());
  assert(h.fleet.ctx.audit->Query({}).size() == audit_before);
}

void TestConflictsAreRetriedThenGiveUp() {
  HookedFleet h;
  h.fleet.ctx.registry->RegisterOrGreet("d1", nullptr);

  int attempts = 0;
  h.hooked->on_update_device = [&] {
    ++attempts;
    return attempts < 3 ? Result::Err(ErrorCode::Conflict, "lost race") : Result::Ok();
  };
  h.fleet.ctx.registry->Decide("d1", ADOPTION_DECISION_APPROVE, "ops");
  assert(attempts == 3);
  assert(h.fleet.ctx.registry->Get("d1").adoption_state() == ADOPTION_STATE_APPROVED);

  attempts                   = 0;
  h.hooked->on_update_device = [&] {
    ++attempts;
    return Result::Err(ErrorCode::Conflict, "lost race");
  };
  ExpectThrows<fleet::util::StorageFailure>([&] { h.fleet.ctx.registry->Decide("d1", ADOPTION_DECISION_REVOKE, "ops"); });
  assert(attempts == fleet::core::kMaxTransactionAttempts);
  h.hooked->on_update_device = nullptr;

  // Exactly one audit row per committed transition.
  fleet::core::AuditQuery query;
  query.subject_id = "d1";
  assert(h.fleet.ctx.audit->Query(query).size() == 2);
}

void TestEveryTransitionHasOneEntry() {
  TestFleet fleet;
  fleet.Adopt("d1");
  const auto a = fleet.Enqueue("d1", "a");
  fleet.ctx.heartbeat->Heartbeat("d1", nullptr);
  fleet.ctx.queue->Complete(a.action_id(), google::protobuf::Struct{}, true, "d1");
  const auto b = fleet.Enqueue("d1", "b");
  fleet.ctx.queue->Cancel(b.action_id(), "ops");

  fleet::core::AuditQuery actions;
  actions.subject_type = SUBJECT_TYPE_ACTION;
  const auto entries   = fleet.ctx.audit->Query(actions);
  // a: none->pending->delivered->completed, b: none->pending->expired
  assert(entries.size() == 5);
  for (std::size_t i = 1; i < entries.size(); ++i) {
    assert(entries[i].entry_id() > entries[i - 1].entry_id());
  }
}

void TestQueryPagingAndHistoryOrder() {
  TestFleet fleet;
  for (int i = 0; i < 12; ++i) {
    fleet.ctx.registry->RegisterOrGreet("d" + std::to_string(i), nullptr);
  }

  fleet::core::AuditQuery page;
  page.limit       = 5;
  const auto first = fleet.ctx.audit->Query(page);
  assert(first.size() == 5);

  page.after_entry_id = first.back().entry_id();
  const auto second   = fleet.ctx.audit->Query(page);
  assert(second.size() == 5);
  assert(second.front().entry_id() > first.back().entry_id());

  const auto history = fleet.ctx.audit->History();
  assert(history.size() == 12);
  assert(history.front().entry_id() > history.back().entry_id());
  assert(history.front().subject_id() == "d11");

  assert(fleet.ctx.audit->History(3).size() == 3);
}

void TestSummaryCounts() {
  TestFleet fleet;
  fleet.Adopt("a");
  fleet.Adopt("b");
  fleet.ctx.registry->RegisterOrGreet("c", nullptr);
  fleet.ctx.registry->RegisterOrGreet("r", nullptr);
  fleet.ctx.registry->Decide("r", ADOPTION_DECISION_REJECT, "ops");

  fleet.Enqueue("a", "one");
  fleet.Enqueue("a", "two");
  fleet.ctx.heartbeat->Heartbeat("a", nullptr);

  auto summary = fleet.ctx.audit->Summary();
  assert(summary.devices_total == 4);
  assert(summary.devices_by_state[ADOPTION_STATE_APPROVED] == 2);
  assert(summary.devices_by_state[ADOPTION_STATE_PENDING] == 1);
  assert(summary.devices_by_state[ADOPTION_STATE_REJECTED] == 1);
  assert(summary.devices_online == 4);
  assert(summary.actions_by_status[ACTION_STATUS_PENDING] == 1);
  assert(summary.actions_by_status[ACTION_STATUS_DELIVERED] == 1);

  fleet.clock->Advance(10min);
  assert(fleet.ctx.audit->Summary().devices_online == 0);
}

void TestSummaryOnlineCountUsesStrictThreshold() {
  fleet::core::FleetPolicy policy;
  policy.offline_threshold = 90s;
  TestFleet fleet(std::make_shared<fleet::db::memory::MemoryRepository>(), policy);
  fleet.Adopt("early");
  fleet.clock->Advance(30s);
  fleet.Adopt("late");

  fleet.clock->Advance(60s - 1ms);
  assert(fleet.ctx.audit->Summary().devices_online == 2);
  fleet.clock->Advance(1ms);
  assert(fleet.ctx.audit->Summary().devices_online == 1);
  fleet.clock->Advance(30s);
  assert(fleet.ctx.audit->Summary().devices_online == 0);
  assert(fleet.ctx.audit->Summary().devices_total == 2);
}

} // namespace

int main() {
  TestFailedAuditRollsBackRegistration();
  TestFailedAuditRollsBackDecision();
  TestFailedAuditRollsBackWholeHeartbeat();
  TestFailedAuditRollsBackReaperExpiry();
  TestFailedAuditSkipsOneStaleDevice();
  TestCommitFailureLeavesNoTrace();
  TestConflictsAreRetriedThenGiveUp();
  TestEveryTransitionHasOneEntry();
  TestQueryPagingAndHistoryOrder();
  TestSummaryCounts();
  TestSummaryOnlineCountUsesStrictThreshold();

  std::cout << "fleet_unit_audit_logger: pass\n";
  return 0;
}
