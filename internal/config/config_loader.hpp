#pragma once

#include <string>

#include "config/config.pb.h"

namespace flightline::config {

/*
  YAML -> RuntimeConfig.

  The document is mapped onto google.protobuf.Value, printed as JSON and
  parsed into the message, so unknown keys and mistyped values fail the
  load. Unset settings are then defaulted and the result validated.
*/
class ConfigLoader {
 public:
  static flightline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static flightline::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(flightline::runtime::config::RuntimeConfig& config);

  // throws std::invalid_argument naming the first bad setting
  static void Validate(const flightline::runtime::config::RuntimeConfig& config);
};

} // namespace flightline::config
