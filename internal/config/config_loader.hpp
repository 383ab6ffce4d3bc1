#pragma once

#include <string>

#include "config/config.pb.h"

namespace favorites::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled by ApplyDefaults() so callers never see empty paths.
*/
class ConfigLoader {
 public:
  static favorites::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static favorites::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(favorites::runtime::config::RuntimeConfig& config);
};

} // namespace favorites::config
