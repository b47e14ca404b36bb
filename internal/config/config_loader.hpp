#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/core/fleet_policy.hpp"

namespace fleet::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, then to JSON, then parsed into the
  message. Unknown fields are rejected. Every loaded config is validated;
  any problem throws std::runtime_error naming the offending field.
*/
class ConfigLoader {
 public:
  static fleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fleet::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void Validate(const fleet::runtime::config::RuntimeConfig& config);
};

// Unset durations keep the FleetPolicy / ReaperOptions defaults.
fleet::core::FleetPolicy   ToFleetPolicy(const fleet::runtime::config::RuntimeConfig& config);
fleet::core::ReaperOptions ToReaperOptions(const fleet::runtime::config::RuntimeConfig& config);

} // namespace fleet::config
