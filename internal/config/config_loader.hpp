#pragma once

#include <string>

#include "config/config.pb.h"

namespace saga::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names follow
  the proto (snake_case or lowerCamelCase) and unknown keys are rejected.
  Loaded configs are validated before they are returned.
*/
class ConfigLoader {
 public:
  static saga::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static saga::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error describing the first invalid setting.
  static void Validate(const saga::runtime::config::RuntimeConfig& config);
};

} // namespace saga::config
