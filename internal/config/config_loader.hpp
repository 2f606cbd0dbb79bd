#pragma once

#include <string>

#include "config/config.pb.h"

namespace offline::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Loaded configs have defaults applied (zero means "use the
  default") and are validated. Failures throw std::runtime_error.
*/
class ConfigLoader {
 public:
  static offline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static offline::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills every unset tunable with its default. Idempotent.
  static void ApplyDefaults(offline::runtime::config::RuntimeConfig& config);

  static void Validate(const offline::runtime::config::RuntimeConfig& config);
};

} // namespace offline::config
