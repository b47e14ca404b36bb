#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "fleet/coordinator/v1.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

using namespace fleet::coordinator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fleetctl <addr> health\n"
            << "  fleetctl <addr> devices [pending|approved|rejected|revoked]\n"
            << "  fleetctl <addr> device <device_id>\n"
            << "  fleetctl <addr> approve|reject|revoke <device_id>\n"
            << "  fleetctl <addr> enqueue <device_id> <spec-json> [ttl_seconds]\n"
            << "  fleetctl <addr> actions [device_id]\n"
            << "  fleetctl <addr> action <action_id>\n"
            << "  fleetctl <addr> cancel <action_id>\n"
            << "  fleetctl <addr> ttl <action_id> [seconds]\n"
            << "  fleetctl <addr> audit [subject_id]\n"
            << "  fleetctl <addr> history\n"
            << "  fleetctl <addr> summary\n"
            << "  fleetctl <addr> sweep\n"
            << "\n"
            << "FLEET_ACTOR names the administrator recorded in the audit trail.\n";
}

static std::optional<uint64_t> ParseId(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<AdoptionState> ParseState(const std::string& value) {
  if (value == "pending") return ADOPTION_STATE_PENDING;
  if (value == "approved") return ADOPTION_STATE_APPROVED;
  if (value == "rejected") return ADOPTION_STATE_REJECTED;
  if (value == "revoked") return ADOPTION_STATE_REVOKED;
  return std::nullopt;
}

// Runs one RPC and prints its response as JSON. Exit 2 on RPC failure.
template <typename Response>
static int Call(const std::function<grpc::Status(grpc::ClientContext*, Response*)>& rpc) {
  grpc::ClientContext ctx;
  if (const char* actor = std::getenv("FLEET_ACTOR")) {
    ctx.AddMetadata("x-fleet-actor", actor);
  }

  Response resp;
  auto     status = rpc(&ctx, &resp);
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  std::cout << fleet::util::ToJson(resp) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];
  auto              arg  = [&](int i) { return i < argc ? std::string(argv[i]) : std::string(); };

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto admin   = FleetAdminService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "health") {
    return Call<HealthResponse>([&](grpc::ClientContext* ctx, HealthResponse* resp) { return admin->Health(ctx, HealthRequest{}, resp); });
  }

  if (cmd == "devices") {
    ListDevicesRequest req;
    if (argc >= 4) {
      auto state = ParseState(arg(3));
      if (!state) {
        std::cerr << "unknown adoption state: " << arg(3) << "\n";
        return 1;
      }
      req.set_state(*state);
    }
    return Call<ListDevicesResponse>([&](grpc::ClientContext* ctx, ListDevicesResponse* resp) { return admin->ListDevices(ctx, req, resp); });
  }

  if (cmd == "device") {
    if (argc < 4) return Usage(), 1;
    GetDeviceRequest req;
    req.set_device_id(arg(3));
    return Call<GetDeviceResponse>([&](grpc::ClientContext* ctx, GetDeviceResponse* resp) { return admin->GetDevice(ctx, req, resp); });
  }

  if (cmd == "approve" || cmd == "reject" || cmd == "revoke") {
    if (argc < 4) return Usage(), 1;
    DecideAdoptionRequest req;
    req.set_device_id(arg(3));
    req.set_decision(cmd == "approve" ? ADOPTION_DECISION_APPROVE : cmd == "reject" ? ADOPTION_DECISION_REJECT : ADOPTION_DECISION_REVOKE);
    return Call<DecideAdoptionResponse>(
        [&](grpc::ClientContext* ctx, DecideAdoptionResponse* resp) { return admin->DecideAdoption(ctx, req, resp); });
  }

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 5) return Usage(), 1;
    EnqueueActionRequest req;
    req.set_device_id(arg(3));
    try {
      fleet::util::ParseJson(arg(4), req.mutable_spec(), "spec");
    } catch (const fleet::util::InvalidArgument& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
    if (argc >= 6) {
      auto ttl = ParseId(arg(5));
      if (!ttl) {
        std::cerr << "invalid ttl_seconds: " << arg(5) << "\n";
        return 1;
      }
      req.set_ttl_seconds(*ttl);
    }
    return Call<EnqueueActionResponse>([&](grpc::ClientContext* ctx, EnqueueActionResponse* resp) { return admin->EnqueueAction(ctx, req, resp); });
  }

  if (cmd == "actions") {
    ListActionsRequest req;
    req.set_device_id(arg(3));
    return Call<ListActionsResponse>([&](grpc::ClientContext* ctx, ListActionsResponse* resp) { return admin->ListActions(ctx, req, resp); });
  }

  if (cmd == "action" || cmd == "cancel" || cmd == "ttl") {
    auto action_id = ParseId(arg(3));
    if (!action_id) {
      std::cerr << "invalid action id: " << arg(3) << "\n";
      return 1;
    }

    if (cmd == "action") {
      GetActionRequest req;
      req.set_action_id(*action_id);
      return Call<GetActionResponse>([&](grpc::ClientContext* ctx, GetActionResponse* resp) { return admin->GetAction(ctx, req, resp); });
    }
    if (cmd == "cancel") {
      CancelActionRequest req;
      req.set_action_id(*action_id);
      return Call<CancelActionResponse>([&](grpc::ClientContext* ctx, CancelActionResponse* resp) { return admin->CancelAction(ctx, req, resp); });
    }
    if (argc < 5) {
      GetActionTtlRequest req;
      req.set_action_id(*action_id);
      return Call<GetActionTtlResponse>([&](grpc::ClientContext* ctx, GetActionTtlResponse* resp) { return admin->GetActionTtl(ctx, req, resp); });
    }
    auto seconds = ParseId(arg(4));
    if (!seconds) {
      std::cerr << "invalid seconds: " << arg(4) << "\n";
      return 1;
    }
    UpdateActionTtlRequest req;
    req.set_action_id(*action_id);
    req.set_ttl_seconds(*seconds);
    return Call<UpdateActionTtlResponse>(
        [&](grpc::ClientContext* ctx, UpdateActionTtlResponse* resp) { return admin->UpdateActionTtl(ctx, req, resp); });
  }

  // ------------------------------------------------------------

  if (cmd == "audit") {
    QueryAuditRequest req;
    req.set_subject_id(arg(3));
    return Call<QueryAuditResponse>([&](grpc::ClientContext* ctx, QueryAuditResponse* resp) { return admin->QueryAudit(ctx, req, resp); });
  }

  if (cmd == "history") {
    return Call<HistoryResponse>([&](grpc::ClientContext* ctx, HistoryResponse* resp) { return admin->History(ctx, HistoryRequest{}, resp); });
  }

  if (cmd == "summary") {
    return Call<SummaryResponse>([&](grpc::ClientContext* ctx, SummaryResponse* resp) { return admin->Summary(ctx, SummaryRequest{}, resp); });
  }

  if (cmd == "sweep") {
    return Call<SweepNowResponse>([&](grpc::ClientContext* ctx, SweepNowResponse* resp) { return admin->SweepNow(ctx, SweepNowRequest{}, resp); });
  }

  Usage();
  return 1;
}
