#pragma once

#include <string>

#include "config/config.pb.h"

namespace kiosk::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Zero/empty fields
  receive the documented defaults, then the result is validated.
*/
class ConfigLoader {
 public:
  static kiosk::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(kiosk::runtime::config::RuntimeConfig* config);

  // Throws std::invalid_argument on inconsistent values.
  static void Validate(const kiosk::runtime::config::RuntimeConfig& config);
};

} // namespace kiosk::config
