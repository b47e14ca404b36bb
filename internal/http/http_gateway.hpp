#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace fleet::service {
class AgentService;
class AdminService;
} // namespace fleet::service

namespace fleet::http {

/*
  HTTP/JSON front of the agent and admin services.

  Bodies use the protobuf JSON mapping with proto field names. The
  administrator for mutating admin routes comes from the body's `actor`, then
  the X-Fleet-Actor header. Errors are returned as {"error","message"}.
*/
class HttpGateway {
 public:
  HttpGateway(std::string host, int port, std::shared_ptr<fleet::service::AgentService> agent,
              std::shared_ptr<fleet::service::AdminService> admin);
  ~HttpGateway();

  HttpGateway(const HttpGateway&)            = delete;
  HttpGateway& operator=(const HttpGateway&) = delete;

  // Binds, then serves on a background thread. Port 0 picks a free port.
  void Start();
  void Stop();

  int port() const {
    return bound_port_;
  }

 private:
  void RegisterRoutes();

  std::string                                   host_;
  int                                           port_;
  int                                           bound_port_ = 0;
  std::shared_ptr<fleet::service::AgentService> agent_;
  std::shared_ptr<fleet::service::AdminService> admin_;

  std::unique_ptr<httplib::Server> server_;
  std::thread                      thread_;
  std::atomic<bool>                running_{false};
};

} // namespace fleet::http
