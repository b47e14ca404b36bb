#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace fleet::config {

using fleet::runtime::config::RuntimeConfig;

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars ("3600s", "8080") stay strings.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        endptr  = nullptr;
  const double numeric = std::strtod(scalar.c_str(), &endptr);
  if (!scalar.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*struct_value->mutable_fields())[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // An empty document is an empty config: every default applies.
  if (yaml.IsNull()) {
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

void RequireNonNegative(const google::protobuf::Duration& d, const char* field) {
  if (d.seconds() < 0 || d.nanos() < 0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must not be negative");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  RequireNonNegative(config.fleet().offline_threshold(), "fleet.offline_threshold");
  RequireNonNegative(config.fleet().pending_adoption_ttl(), "fleet.pending_adoption_ttl");
  RequireNonNegative(config.actions().default_ttl(), "actions.default_ttl");
  RequireNonNegative(config.actions().max_ttl(), "actions.max_ttl");
  RequireNonNegative(config.reaper().interval(), "reaper.interval");

  if (config.fleet().has_offline_threshold() && util::FromProto(config.fleet().offline_threshold()).count() <= 0) {
    throw std::runtime_error("Invalid configuration: fleet.offline_threshold must be positive");
  }
  if (config.reaper().has_interval() && util::FromProto(config.reaper().interval()).count() <= 0) {
    throw std::runtime_error("Invalid configuration: reaper.interval must be positive");
  }

  const auto policy = ToFleetPolicy(config);
  if (policy.default_action_ttl > policy.max_action_ttl) {
    throw std::runtime_error("Invalid configuration: actions.default_ttl exceeds actions.max_ttl");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  if (config.server().http().enabled() && config.server().http().port() > 65535) {
    throw std::runtime_error("Invalid configuration: server.http.port out of range");
  }
}

fleet::core::FleetPolicy ToFleetPolicy(const RuntimeConfig& config) {
  fleet::core::FleetPolicy policy;
  if (config.fleet().has_offline_threshold()) {
    if (auto v = util::FromProto(config.fleet().offline_threshold()); v.count() > 0) {
      policy.offline_threshold = v;
    }
  }
  // Explicit zero disables auto-reject, so presence is what matters here.
  if (config.fleet().has_pending_adoption_ttl()) {
    policy.pending_adoption_ttl = util::FromProto(config.fleet().pending_adoption_ttl());
  }
  if (config.actions().has_default_ttl()) {
    policy.default_action_ttl = util::FromProto(config.actions().default_ttl());
  }
  if (config.actions().has_max_ttl()) {
    if (auto v = util::FromProto(config.actions().max_ttl()); v.count() > 0) {
      policy.max_action_ttl = v;
    }
  }
  return policy;
}

fleet::core::ReaperOptions ToReaperOptions(const RuntimeConfig& config) {
  fleet::core::ReaperOptions options;
  if (config.reaper().has_enabled()) {
    options.enabled = config.reaper().enabled();
  }
  if (auto v = util::FromProto(config.reaper().interval()); v.count() > 0) {
    options.interval = v;
  }
  if (config.reaper().batch_size() > 0) {
    options.batch_size = config.reaper().batch_size();
  }
  return options;
}

} // namespace fleet::config
