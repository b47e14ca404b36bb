#include <assert.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/test_fleet.hpp"

#if FLEET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using namespace std::chrono_literals;
using namespace fleet::coordinator::core::v1;
using fleet::testing::TestFleet;

constexpr int kThreads = 8;

struct Backend {
  std::string                                       name;
  std::function<std::shared_ptr<fleet::db::Repository>()> make;
  std::function<void()>                             cleanup;
};

// Number of audit rows that moved the action into `to_state`.
std::size_t CountTransitions(TestFleet& fleet, uint64_t action_id, const std::string& to_state) {
  fleet::core::AuditQuery query;
  query.subject_type = SUBJECT_TYPE_ACTION;
  query.subject_id   = std::to_string(action_id);
  query.limit        = 1000;

  std::size_t count = 0;
  for (const auto& entry : fleet.ctx.audit->Query(query)) {
    if (entry.to_state() == to_state) {
      ++count;
    }
  }
  return count;
}

template <typename Fn>
void RunConcurrently(int threads, Fn&& fn) {
  std::atomic<bool>        go{false};
  std::vector<std::thread> workers;
  workers.reserve(threads);
  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&, i] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      fn(i);
    });
  }
  go.store(true);
  for (auto& worker : workers) {
    worker.join();
  }
}

void TestConcurrentHeartbeatsDeliverOneAction(const Backend& backend) {
  TestFleet fleet(backend.make());
  fleet.Adopt("d1");
  const auto a1 = fleet.Enqueue("d1", "apt-upgrade");
  const auto a2 = fleet.Enqueue("d1", "reboot");

  std::mutex            mu;
  std::vector<uint64_t> handed_out;
  std::atomic<int>      storage_failures{0};

  RunConcurrently(kThreads, [&](int) {
    for (int round = 0; round < 5; ++round) {
      try {
        auto result = fleet.ctx.heartbeat->Heartbeat("d1", nullptr);
        if (result.next_action) {
          std::lock_guard<std::mutex> lock(mu);
          handed_out.push_back(result.next_action->action_id());
        }
      } catch (const fleet::util::StorageFailure&) {
        // Retries exhausted under contention; nothing was committed.
        storage_failures.fetch_add(1);
      }
    }
  });

  assert(handed_out.size() <= 1);
  if (handed_out.empty()) {
    auto result = fleet.ctx.heartbeat->Heartbeat("d1", nullptr);
    assert(result.next_action);
    handed_out.push_back(result.next_action->action_id());
  }

  assert(handed_out.front() == a1.action_id());
  assert(fleet.ctx.queue->Get(a1.action_id()).status() == ACTION_STATUS_DELIVERED);
  assert(fleet.ctx.queue->Get(a2.action_id()).status() == ACTION_STATUS_PENDING);
  assert(CountTransitions(fleet, a1.action_id(), "delivered") == 1);
  assert(CountTransitions(fleet, a2.action_id(), "delivered") == 0);

  // While a1 is outstanding no further heartbeat hands out a2.
  assert(!fleet.ctx.heartbeat->Heartbeat("d1", nullptr).next_action);
}

void TestCompletionRacingExpiryHasOneOutcome(const Backend& backend) {
  TestFleet fleet(backend.make());
  fleet.Adopt("d1");
  const auto action = fleet.Enqueue("d1", "apt-upgrade", 60s);
  assert(fleet.ctx.heartbeat->Heartbeat("d1", nullptr).next_action);

  fleet.clock->Advance(61s);

  std::atomic<bool> completed{false};
  std::atomic<bool> expired{false};

  RunConcurrently(2, [&](int i) {
    try {
      if (i == 0) {
        google::protobuf::Struct result;
        (*result.mutable_fields())["exit_code"].set_number_value(0);
        fleet.ctx.queue->Complete(action.action_id(), result, true, "d1");
        completed.store(true);
      } else {
        expired.store(fleet.ctx.reaper->Sweep().expired_actions == 1);
      }
    } catch (const fleet::util::InvalidStateTransition&) {
      // The reaper got there first.
    } catch (const fleet::util::StorageFailure&) {
    }
  });

  assert(!(completed.load() && expired.load()));

  // Settle anything a StorageFailure left behind.
  fleet.ctx.reaper->Sweep();

  const auto status = fleet.ctx.queue->Get(action.action_id()).status();
  assert(status == ACTION_STATUS_COMPLETED || status == ACTION_STATUS_EXPIRED);
  const auto terminal = CountTransitions(fleet, action.action_id(), "completed") + CountTransitions(fleet, action.action_id(), "expired");
  assert(terminal == 1);
  if (completed.load()) {
    assert(status == ACTION_STATUS_COMPLETED);
  }
}

void TestOverlappingSweepsExpireEachActionOnce(const Backend& backend) {
  TestFleet fleet(backend.make());

  std::vector<uint64_t> ids;
  for (int i = 0; i < 12; ++i) {
    const auto device = "d" + std::to_string(i % 3);
    if (i < 3) {
      fleet.Adopt(device);
    }
    ids.push_back(fleet.Enqueue(device, "job-" + std::to_string(i), 30s).action_id());
  }

  fleet.clock->Advance(31s);

  std::atomic<uint64_t> reported{0};
  RunConcurrently(4, [&](int) {
    try {
      reported.fetch_add(fleet.ctx.reaper->Sweep().expired_actions);
    } catch (const fleet::util::StorageFailure&) {
    }
  });
  assert(reported.load() <= ids.size());

  reported.fetch_add(fleet.ctx.reaper->Sweep().expired_actions);
  assert(reported.load() == ids.size());
  assert(fleet.ctx.reaper->Sweep().expired_actions == 0);

  for (const auto id : ids) {
    assert(fleet.ctx.queue->Get(id).status() == ACTION_STATUS_EXPIRED);
    assert(CountTransitions(fleet, id, "expired") == 1);
  }
}

void TestConcurrentFirstContactRegistersOnce(const Backend& backend) {
  TestFleet fleet(backend.make());

  std::atomic<int> greeted{0};
  RunConcurrently(kThreads, [&](int) {
    try {
      auto result = fleet.ctx.heartbeat->Heartbeat("new-device", nullptr);
      assert(result.status == "pending");
      greeted.fetch_add(1);
    } catch (const fleet::util::StorageFailure&) {
    }
  });
  assert(greeted.load() >= 1);

  fleet::core::AuditQuery query;
  query.subject_type = SUBJECT_TYPE_DEVICE;
  query.subject_id   = "new-device";
  const auto entries = fleet.ctx.audit->Query(query);
  assert(entries.size() == 1);
  assert(entries[0].from_state() == "none");
  assert(entries[0].to_state() == "pending");
}

void RunSuite(const Backend& backend) {
  std::cout << "running dispatch suite: " << backend.name << "\n";
  TestConcurrentHeartbeatsDeliverOneAction(backend);
  TestCompletionRacingExpiryHasOneOutcome(backend);
  TestOverlappingSweepsExpireEachActionOnce(backend);
  TestConcurrentFirstContactRegistersOnce(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<Backend> backends;
  backends.push_back(Backend{
      .name    = "memory",
      .make    = [] { return std::make_shared<fleet::db::memory::MemoryRepository>(); },
      .cleanup = [] {},
  });

#if FLEET_DB_SQLITE
  const auto dir = std::filesystem::temp_directory_path() /
                   ("fleet_dispatch_concurrency_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  auto counter = std::make_shared<int>(0);
  backends.push_back(Backend{
      .name = "sqlite",
      .make =
          [dir, counter] {
            // A fresh file per test keeps the suites independent.
            const auto path = (dir / ("fleet-" + std::to_string((*counter)++) + ".db")).string();
            auto       db   = std::make_shared<fleet::db::sqlite::SqliteDB>(path);
            fleet::db::sqlite::BootstrapSchema(*db);
            return std::make_shared<fleet::db::sqlite::SqliteRepository>(std::move(db));
          },
      .cleanup = [dir] { std::filesystem::remove_all(dir); },
  });
#endif

  for (const auto& backend : backends) {
    RunSuite(backend);
  }

  std::cout << "fleet_integration_dispatch_concurrency: pass\n";
  return 0;
}
