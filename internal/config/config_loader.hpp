#pragma once

#include <string>

#include "config/config.pb.h"

namespace bridge::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing board/gas/chain values get their defaults and the
  result is validated.
*/
class ConfigLoader {
 public:
  static bridge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static bridge::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(bridge::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument naming the offending key.
  static void Validate(const bridge::runtime::config::RuntimeConfig& config);
};

} // namespace bridge::config
