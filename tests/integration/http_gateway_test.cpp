#include <assert.h>

#include <httplib.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "fleet/coordinator/v1.hpp"
#include "internal/http/http_gateway.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/agent_service.hpp"
#include "internal/util/json.hpp"
#include "support/test_fleet.hpp"

namespace {

using namespace std::chrono_literals;
using namespace fleet::coordinator::v1;
using fleet::http::HttpGateway;
using fleet::service::AdminService;
using fleet::service::AgentService;
using fleet::testing::TestFleet;

constexpr char kJson[] = "application/json";

/*
  Gateway on an ephemeral port over the in-memory object graph, plus a
  client pointed at it.
*/
struct Harness {
  TestFleet                     fleet;
  std::shared_ptr<AgentService> agent = std::make_shared<AgentService>(fleet.ctx);
  std::shared_ptr<AdminService> admin = std::make_shared<AdminService>(fleet.ctx);
  HttpGateway                   gateway{"127.0.0.1", 0, agent, admin};
  std::unique_ptr<httplib::Client> client;

  Harness() {
    gateway.Start();
    assert(gateway.port() > 0);
    client = std::make_unique<httplib::Client>("127.0.0.1", gateway.port());
    client->set_connection_timeout(2, 0);
    client->set_read_timeout(5, 0);
  }

  ~Harness() {
    gateway.Stop();
  }

  template <typename Message>
  Message Get(const std::string& path) {
    auto res = client->Get(path);
    assert(res);
    assert(res->status == 200);
    Message message;
    fleet::util::ParseJson(res->body, &message, path);
    return message;
  }

  template <typename Message>
  Message Post(const std::string& path, const std::string& body, const httplib::Headers& headers = {}) {
    auto res = client->Post(path, headers, body, kJson);
    assert(res);
    assert(res->status == 200);
    Message message;
    fleet::util::ParseJson(res->body, &message, path);
    return message;
  }

  // Expects a failure and returns the {"error","message"} body.
  google::protobuf::Struct ExpectError(httplib::Result res, int status) {
    assert(res);
    assert(res->status == status);
    google::protobuf::Struct body;
    fleet::util::ParseJson(res->body, &body, "error body");
    assert(body.fields().contains("message"));
    return body;
  }
};

void TestHealthAndUnknownRoute() {
  Harness h;
  assert(h.Get<HealthResponse>("/api/health").status() == "ok");

  auto body = h.ExpectError(h.client->Get("/api/nope"), 404);
  assert(body.fields().at("error").string_value() == "not_found");
}

void TestAdoptionDispatchAndCompletionOverHttp() {
  Harness h;

  auto registered = h.Post<RegisterDeviceResponse>("/api/device/d1", R"({"hostname":"d1.local","os_name":"debian"})");
  assert(registered.status() == "pending");

  // Pending devices get no commands.
  auto poll = h.Get<HeartbeatResponse>("/api/devices/d1/commands/poll");
  assert(poll.status() == "pending");
  assert(!poll.has_next_action());

  auto approved = h.Post<DecideAdoptionResponse>("/api/device/d1/approve", "", {{"X-Fleet-Actor", "alice"}});
  assert(approved.device().adoption_state() == ADOPTION_STATE_APPROVED);

  auto enqueued = h.Post<EnqueueActionResponse>("/api/actions", R"({"device_id":"d1","spec":{"command":"apt-upgrade"},"ttl_seconds":120})",
                                                {{"X-Fleet-Actor", "alice"}});
  const auto action_id = enqueued.action().action_id();
  assert(enqueued.action().status() == ACTION_STATUS_PENDING);
  assert(enqueued.action().created_by() == "alice");

  h.fleet.clock->Advance(1s);
  auto heartbeat = h.Post<HeartbeatResponse>("/api/devices/heartbeat", R"({"device_id":"d1"})");
  assert(heartbeat.status() == "approved");
  assert(heartbeat.has_next_action());
  assert(heartbeat.next_action().action_id() == action_id);
  assert(heartbeat.next_action().spec().fields().at("command").string_value() == "apt-upgrade");

  const auto ttl = h.Get<GetActionTtlResponse>("/api/actions/" + std::to_string(action_id) + "/ttl");
  assert(ttl.remaining_seconds() == 119);

  auto done = h.Post<CompleteActionResponse>("/api/devices/d1/commands/" + std::to_string(action_id) + "/result",
                                             R"({"success":true,"result":{"exit_code":0}})");
  assert(done.action().status() == ACTION_STATUS_COMPLETED);

  // A second result for the same action is a state conflict.
  auto conflict = h.ExpectError(h.client->Post("/api/actions/" + std::to_string(action_id) + "/result", R"({"success":false})", kJson), 409);
  assert(conflict.fields().at("error").string_value() == "invalid_state_transition");

  auto audit = h.Get<QueryAuditResponse>("/api/audit?subject_type=device&subject_id=d1");
  assert(audit.entries_size() == 2);
  assert(audit.entries(1).to_state() == "approved");
  assert(audit.entries(1).actor().type() == ACTOR_TYPE_ADMINISTRATOR);
  assert(audit.entries(1).actor().id() == "alice");

  auto listed = h.Get<ListActionsResponse>("/api/actions?device_id=d1&status=completed");
  assert(listed.actions_size() == 1);
}

void TestBodyActorWinsOverHeader() {
  Harness h;
  h.Post<RegisterDeviceResponse>("/api/device/d2", "");
  h.Post<DecideAdoptionResponse>("/api/device/d2/reject", R"({"actor":"bob"})", {{"X-Fleet-Actor", "alice"}});

  auto audit = h.Get<QueryAuditResponse>("/api/audit?subject_id=d2");
  assert(audit.entries_size() == 2);
  assert(audit.entries(1).actor().id() == "bob");
  assert(audit.entries(1).to_state() == "rejected");
}

void TestErrorsMapToHttpStatuses() {
  Harness h;

  auto unknown = h.ExpectError(h.client->Get("/api/device/ghost"), 404);
  assert(unknown.fields().at("error").string_value() == "unknown_device");

  h.ExpectError(h.client->Get("/api/actions?status=bogus"), 400);

  // Paging values past 32 bits are rejected, not wrapped to 0.
  auto wide = h.ExpectError(h.client->Get("/api/actions?limit=4294967296"), 400);
  assert(wide.fields().at("error").string_value() == "invalid_argument");
  h.ExpectError(h.client->Get("/api/actions?offset=4294967296"), 400);
  h.ExpectError(h.client->Get("/api/history?limit=4294967296"), 400);
  h.ExpectError(h.client->Get("/api/audit?limit=4294967296"), 400);
  assert(h.client->Get("/api/actions?limit=4294967295")->status == 200);
  h.ExpectError(h.client->Get("/api/devices?online=maybe"), 400);
  h.ExpectError(h.client->Post("/api/actions", "{not json", kJson), 400);

  // Commands for a device that is not approved are refused.
  h.Post<RegisterDeviceResponse>("/api/device/d3", "");
  auto refused = h.ExpectError(h.client->Post("/api/actions", R"({"device_id":"d3","spec":{"command":"reboot"}})", kJson), 404);
  assert(refused.fields().at("error").string_value() == "unknown_device");

  // A pending device may not report results, even for a real action.
  h.Post<RegisterDeviceResponse>("/api/device/d5", "");
  h.Post<DecideAdoptionResponse>("/api/device/d5/approve", "");
  const auto action_id =
      h.Post<EnqueueActionResponse>("/api/actions", R"({"device_id":"d5","spec":{"command":"reboot"}})").action().action_id();
  auto forbidden =
      h.ExpectError(h.client->Post("/api/devices/d3/commands/" + std::to_string(action_id) + "/result", R"({"success":true})", kJson), 403);
  assert(forbidden.fields().at("error").string_value() == "unauthorized");

  h.ExpectError(h.client->Get("/api/actions/99"), 404);
}

void TestSweepAndFeed() {
  Harness h;
  h.Post<RegisterDeviceResponse>("/api/device/d4", "");
  h.Post<DecideAdoptionResponse>("/api/device/d4/approve", "");
  h.Post<EnqueueActionResponse>("/api/actions", R"({"device_id":"d4","spec":{"command":"reboot"},"ttl_seconds":5})");

  h.fleet.clock->Advance(6s);
  auto sweep = h.Post<SweepNowResponse>("/api/reaper/sweep", "");
  assert(sweep.expired_actions() == 1);
  assert(sweep.expired_count() == 1);

  auto history = h.Get<HistoryResponse>("/api/history?limit=1");
  assert(history.history_size() == 1);
  assert(history.history(0).to_state() == "expired");
  assert(history.history(0).actor().type() == ACTOR_TYPE_REAPER);

  auto feed = h.client->Get("/api/");
  assert(feed && feed->status == 200);
  google::protobuf::Struct body;
  fleet::util::ParseJson(feed->body, &body, "feed");
  assert(body.fields().contains("summary"));
  assert(body.fields().at("history").list_value().values_size() == 4);
}

} // namespace

int main() {
  TestHealthAndUnknownRoute();
  TestAdoptionDispatchAndCompletionOverHttp();
  TestBodyActorWinsOverHeader();
  TestErrorsMapToHttpStatuses();
  TestSweepAndFeed();

  std::cout << "fleet_integration_http_gateway: pass\n";
  return 0;
}
