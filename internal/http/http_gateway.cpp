#include "http_gateway.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "internal/http/http_error.hpp"
#include "internal/model/audit_vocabulary.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/agent_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleet::http {

using namespace fleet::coordinator::core::v1;
using namespace fleet::coordinator::services::v1;

namespace {

constexpr char kJson[]        = "application/json";
constexpr char kActorHeader[] = "X-Fleet-Actor";

template <typename Fn>
void Serve(const httplib::Request& req, httplib::Response& res, Fn&& fn) {
  try {
    res.set_content(fn(), kJson);
    res.status = 200;
  } catch (const std::exception& e) {
    auto error = ToHttpError(e);
    FLEET_LOG_ERROR("HTTP request failed", {observability::StringField("method", req.method), observability::StringField("path", req.path),
                                            observability::IntField("status", error.status), observability::StringField("error", e.what())});
    res.status = error.status;
    res.set_content(error.body, kJson);
  }
}

template <typename Message>
Message ParseBody(const httplib::Request& req, const std::string& what) {
  Message message;
  if (!req.body.empty()) {
    util::ParseJson(req.body, &message, what);
  }
  return message;
}

uint64_t ParseU64(const std::string& text, const std::string& what) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw util::InvalidArgument(what + " must be an unsigned integer: " + text);
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw util::InvalidArgument(what + " out of range: " + text);
  }
}

uint32_t ParseU32(const std::string& text, const std::string& what) {
  const auto value = ParseU64(text, what);
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidArgument(what + " out of range: " + text);
  }
  return static_cast<uint32_t>(value);
}

bool ParseBool(const std::string& text, const std::string& what) {
  if (text == "true" || text == "1") {
    return true;
  }
  if (text == "false" || text == "0") {
    return false;
  }
  throw util::InvalidArgument(what + " must be true or false: " + text);
}

std::string Param(const httplib::Request& req, const char* name) {
  return req.has_param(name) ? req.get_param_value(name) : std::string();
}

template <typename Request>
void FillActor(const httplib::Request& http_req, Request& request) {
  if (request.actor().empty()) {
    request.set_actor(http_req.get_header_value(kActorHeader));
  }
}

AdoptionDecision ParseDecision(const std::string& verb) {
  if (verb == "approve") return ADOPTION_DECISION_APPROVE;
  if (verb == "reject") return ADOPTION_DECISION_REJECT;
  return ADOPTION_DECISION_REVOKE;
}

} // namespace

HttpGateway::HttpGateway(std::string host, int port, std::shared_ptr<fleet::service::AgentService> agent,
                         std::shared_ptr<fleet::service::AdminService> admin)
    : host_(std::move(host)), port_(port), agent_(std::move(agent)), admin_(std::move(admin)), server_(std::make_unique<httplib::Server>()) {
  RegisterRoutes();
}

HttpGateway::~HttpGateway() {
  Stop();
}

void HttpGateway::Start() {
  if (port_ == 0) {
    bound_port_ = server_->bind_to_any_port(host_);
    if (bound_port_ < 0) {
      throw std::runtime_error("HTTP gateway failed to bind " + host_);
    }
  } else {
    if (!server_->bind_to_port(host_, port_)) {
      throw std::runtime_error("HTTP gateway failed to bind " + host_ + ":" + std::to_string(port_));
    }
    bound_port_ = port_;
  }

  running_ = true;
  thread_  = std::thread([this] { server_->listen_after_bind(); });
  FLEET_LOG_INFO("HTTP gateway listening", {observability::StringField("host", host_), observability::IntField("port", bound_port_)});
}

void HttpGateway::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  server_->stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void HttpGateway::RegisterRoutes() {
  auto& srv = *server_;

  // ------------------------------------------------------------------
  // Health + aggregate feed
  // ------------------------------------------------------------------
  srv.Get("/api/health", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] { return util::ToJson(admin_->Health(HealthRequest{})); });
  });

  srv.Get("/api/", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      auto summary = admin_->Summary(SummaryRequest{});
      auto history = admin_->History(HistoryRequest{});

      std::string body = "{\"summary\":" + util::ToJson(summary) + ",\"history\":[";
      for (int i = 0; i < history.history_size(); ++i) {
        if (i > 0) {
          body.push_back(',');
        }
        body += util::ToJson(history.history(i));
      }
      body += "]}";
      return body;
    });
  });

  srv.Get("/api/history", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      HistoryRequest request;
      if (auto limit = Param(req, "limit"); !limit.empty()) {
        request.set_limit(ParseU32(limit, "limit"));
      }
      return util::ToJson(admin_->History(request));
    });
  });

  // ------------------------------------------------------------------
  // Devices
  // ------------------------------------------------------------------
  srv.Get("/api/devices", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      ListDevicesRequest request;
      if (auto state = Param(req, "state"); !state.empty()) {
        const auto parsed = model::ParseAdoptionState(state);
        if (parsed == ADOPTION_STATE_UNSPECIFIED) {
          throw util::InvalidArgument("unknown adoption state: " + state);
        }
        request.set_state(parsed);
      }
      if (auto online = Param(req, "online"); !online.empty()) {
        request.set_online(ParseBool(online, "online"));
      }
      return util::ToJson(admin_->ListDevices(request));
    });
  });

  srv.Get(R"(/api/device/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      GetDeviceRequest request;
      request.set_device_id(req.matches[1].str());
      return util::ToJson(admin_->GetDevice(request));
    });
  });

  srv.Post(R"(/api/device/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      RegisterDeviceRequest request;
      request.set_device_id(req.matches[1].str());
      if (!req.body.empty()) {
        *request.mutable_system_info() = ParseBody<SystemInfo>(req, "system_info");
      }
      return util::ToJson(agent_->RegisterDevice(request));
    });
  });

  srv.Post(R"(/api/device/([^/]+)/(approve|reject|revoke))", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      auto request = ParseBody<DecideAdoptionRequest>(req, "decision request");
      request.set_device_id(req.matches[1].str());
      request.set_decision(ParseDecision(req.matches[2].str()));
      FillActor(req, request);
      return util::ToJson(admin_->DecideAdoption(request));
    });
  });

  srv.Post("/api/devices/heartbeat", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] { return util::ToJson(agent_->Heartbeat(ParseBody<HeartbeatRequest>(req, "heartbeat"))); });
  });

  srv.Get("/api/devices/heartbeat", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      HeartbeatRequest request;
      request.set_device_id(Param(req, "device_id"));
      return util::ToJson(agent_->Heartbeat(request));
    });
  });

  srv.Get(R"(/api/devices/([^/]+)/commands/poll)", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      HeartbeatRequest request;
      request.set_device_id(req.matches[1].str());
      return util::ToJson(agent_->Heartbeat(request));
    });
  });

  srv.Post(R"(/api/devices/([^/]+)/commands/([^/]+)/result)", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      auto request = ParseBody<CompleteActionRequest>(req, "action result");
      request.set_device_id(req.matches[1].str());
      request.set_action_id(ParseU64(req.matches[2].str(), "action_id"));
      return util::ToJson(agent_->CompleteAction(request));
    });
  });

  // ------------------------------------------------------------------
  // Actions
  // ------------------------------------------------------------------
  srv.Get("/api/actions", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      ListActionsRequest request;
      request.set_device_id(Param(req, "device_id"));
      if (auto status = Param(req, "status"); !status.empty()) {
        const auto parsed = model::ParseActionStatus(status);
        if (parsed == ACTION_STATUS_UNSPECIFIED) {
          throw util::InvalidArgument("unknown action status: " + status);
        }
        request.set_status(parsed);
      }
      if (auto limit = Param(req, "limit"); !limit.empty()) {
        request.set_limit(ParseU32(limit, "limit"));
      }
      if (auto offset = Param(req, "offset"); !offset.empty()) {
        request.set_offset(ParseU32(offset, "offset"));
      }
      return util::ToJson(admin_->ListActions(request));
    });
  });

  srv.Post("/api/actions", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      auto request = ParseBody<EnqueueActionRequest>(req, "enqueue request");
      FillActor(req, request);
      return util::ToJson(admin_->EnqueueAction(request));
    });
  });

  srv.Get(R"(/api/actions/(\d+))", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      GetActionRequest request;
      request.set_action_id(ParseU64(req.matches[1].str(), "action_id"));
      return util::ToJson(admin_->GetAction(request));
    });
  });

  srv.Post(R"(/api/actions/(\d+)/result)", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      auto request = ParseBody<CompleteActionRequest>(req, "action result");
      request.set_action_id(ParseU64(req.matches[1].str(), "action_id"));
      return util::ToJson(agent_->CompleteAction(request));
    });
  });

  srv.Post(R"(/api/actions/(\d+)/cancel)", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      auto request = ParseBody<CancelActionRequest>(req, "cancel request");
      request.set_action_id(ParseU64(req.matches[1].str(), "action_id"));
      FillActor(req, request);
      return util::ToJson(admin_->CancelAction(request));
    });
  });

  srv.Get(R"(/api/actions/(\d+)/ttl)", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      GetActionTtlRequest request;
      request.set_action_id(ParseU64(req.matches[1].str(), "action_id"));
      return util::ToJson(admin_->GetActionTtl(request));
    });
  });

  srv.Post(R"(/api/actions/(\d+)/ttl)", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      auto request = ParseBody<UpdateActionTtlRequest>(req, "ttl request");
      request.set_action_id(ParseU64(req.matches[1].str(), "action_id"));
      FillActor(req, request);
      return util::ToJson(admin_->UpdateActionTtl(request));
    });
  });

  // ------------------------------------------------------------------
  // Audit + reaper
  // ------------------------------------------------------------------
  srv.Get("/api/audit", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] {
      QueryAuditRequest request;
      if (auto subject_type = Param(req, "subject_type"); !subject_type.empty()) {
        const auto parsed = model::ParseSubjectType(subject_type);
        if (parsed == SUBJECT_TYPE_UNSPECIFIED) {
          throw util::InvalidArgument("unknown subject_type: " + subject_type);
        }
        request.set_subject_type(parsed);
      }
      request.set_subject_id(Param(req, "subject_id"));
      if (auto after = Param(req, "after"); !after.empty()) {
        request.set_after_entry_id(ParseU64(after, "after"));
      }
      if (auto limit = Param(req, "limit"); !limit.empty()) {
        request.set_limit(ParseU32(limit, "limit"));
      }
      return util::ToJson(admin_->QueryAudit(request));
    });
  });

  srv.Post("/api/reaper/sweep", [this](const httplib::Request& req, httplib::Response& res) {
    Serve(req, res, [&] { return util::ToJson(admin_->SweepNow(SweepNowRequest{})); });
  });

  srv.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) {
      res.set_content(R"({"error":"not_found","message":"no such route"})", kJson);
    }
  });
}

} // namespace fleet::http
