#pragma once

#include <string>

#include "config/config.pb.h"

namespace streamgate::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Loading fills defaults for unset fields and validates bounds.
*/
class ConfigLoader {
 public:
  static streamgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static streamgate::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(streamgate::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the offending field.
  static void Validate(const streamgate::runtime::config::RuntimeConfig& config);
};

} // namespace streamgate::config
