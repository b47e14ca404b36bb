#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reaper/reaper_worker.hpp"
#include "internal/runtime/server.hpp"
#if FLEET_HTTP_GATEWAY
#include "internal/http/http_gateway.hpp"
#endif

using fleet::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  fleet::observability::ShutdownLogging();
  fleet::observability::ShutdownMetrics();
  fleet::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: fleet-coordinator <config.yaml> OR fleet-coordinator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fleet::config::ConfigLoader::LoadFromYaml(config_path);

    fleet::observability::InitializeTracing(config);
    fleet::observability::InitializeMetrics(config);
    fleet::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = fleet::factory::Build(config);

    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50051") : config.server().bind_address();
    Server     server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting anything to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Start: gRPC, HTTP gateway, reaper
    // ------------------------------------------------------------
    server.Start();
#if FLEET_HTTP_GATEWAY
    if (app.http_gateway) {
      app.http_gateway->Start();
    }
#endif
    if (app.reaper_worker) {
      app.reaper_worker->Start();
    }
    FLEET_LOG_INFO("fleet coordinator started", {fleet::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // ------------------------------------------------------------
    // Stop in reverse order
    // ------------------------------------------------------------
    FLEET_LOG_INFO("shutting down fleet coordinator");
    if (app.reaper_worker) {
      app.reaper_worker->Stop();
    }
#if FLEET_HTTP_GATEWAY
    if (app.http_gateway) {
      app.http_gateway->Stop();
    }
#endif
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Fatal error", {fleet::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
