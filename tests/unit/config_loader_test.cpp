#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace std::chrono_literals;
using fleet::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fleet_coordinator_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "0.0.0.0:50061"
  http:
    enabled: true
    host: "127.0.0.1"
    port: 8080
database:
  sqlite:
    path: "/var/lib/fleet/fleet.db"
fleet:
  offline_threshold: "120s"
  pending_adoption_ttl: "3600s"
actions:
  default_ttl: "600s"
  max_ttl: "86400s"
reaper:
  enabled: false
  interval: "5s"
  batch_size: 50
logging:
  level: "debug"
observability:
  tracing_enabled: true
  otlp_endpoint: "collector:4317"
  transport: "OTLP_TRANSPORT_HTTP"
  metrics:
    collection_interval_ms: 2500
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.server().http().enabled());
  assert(config.server().http().port() == 8080);
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/fleet/fleet.db");
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == fleet::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().metrics().collection_interval_ms() == 2500);

  const auto policy = fleet::config::ToFleetPolicy(config);
  assert(policy.offline_threshold == 120s);
  assert(policy.pending_adoption_ttl == 1h);
  assert(policy.default_action_ttl == 600s);
  assert(policy.max_action_ttl == 24h);

  const auto reaper = fleet::config::ToReaperOptions(config);
  assert(!reaper.enabled);
  assert(reaper.interval == 5s);
  assert(reaper.batch_size == 50);
}

void TestEmptyDocumentKeepsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());

  const auto policy = fleet::config::ToFleetPolicy(config);
  assert(policy.offline_threshold == fleet::core::FleetPolicy::kDefaultOfflineThreshold);
  assert(policy.pending_adoption_ttl == fleet::core::FleetPolicy::kDefaultPendingAdoptionTtl);
  assert(policy.default_action_ttl == 3600s);
  assert(policy.max_action_ttl == fleet::core::FleetPolicy::kDefaultMaxActionTtl);

  const auto reaper = fleet::config::ToReaperOptions(config);
  assert(reaper.enabled);
  assert(reaper.interval == 10s);
  assert(reaper.batch_size == 500);
}

void TestExplicitZeroPendingTtlDisablesAutoReject() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(fleet:
  pending_adoption_ttl: "0s"
)");
  assert(fleet::config::ToFleetPolicy(config).pending_adoption_ttl == 0ms);
}

void TestScalarEscapingForQuotedValues() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
database:
  sqlite:
    path: "C:\\fleet\\\"quoted\"\\db.sqlite"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().sqlite().path() == "C:\\fleet\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");

  assert(Rejects(R"(reaper:
  period: "5s"
)"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("fleet:\n  offline_threshold: \"0s\"\n"));
  assert(Rejects("fleet:\n  offline_threshold: \"-5s\"\n"));
  assert(Rejects("reaper:\n  interval: \"0s\"\n"));
  assert(Rejects("actions:\n  default_ttl: \"7200s\"\n  max_ttl: \"3600s\"\n"));
  assert(Rejects("actions:\n  default_ttl: \"soon\"\n"));
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("server:\n  http:\n    enabled: true\n    port: 70000\n"));
  assert(Rejects("- just\n- a list\n"));
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/fleet-coordinator.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentKeepsDefaults();
  TestExplicitZeroPendingTtlDisablesAutoReject();
  TestScalarEscapingForQuotedValues();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsRejected();

  std::cout << "fleet_unit_config_loader: pass\n";
  return 0;
}
