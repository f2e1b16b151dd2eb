#pragma once

#include <string>

#include "config/config.pb.h"

namespace assetdiff::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Missing optional values
  are filled with defaults, then the result is validated; the loaded value is
  passed by reference into every component for the life of the process.
*/
class ConfigLoader {
 public:
  static assetdiff::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(assetdiff::runtime::config::RuntimeConfig& config);
  static void Validate(const assetdiff::runtime::config::RuntimeConfig& config);
};

} // namespace assetdiff::config
