#pragma once

#include <string>

#include "config/config.pb.h"

namespace flowstead::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so durations are
  written the protobuf JSON way ("30s", "0.5s"). Unknown keys are
  rejected. Unset fields are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static flowstead::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static flowstead::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(flowstead::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument.
  static void Validate(const flowstead::runtime::config::RuntimeConfig& config);
};

} // namespace flowstead::config
