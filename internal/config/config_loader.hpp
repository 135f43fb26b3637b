#pragma once

#include <string>

#include "config/config.pb.h"

namespace elevator::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing sections are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static elevator::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static elevator::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(elevator::runtime::config::RuntimeConfig* config);
};

} // namespace elevator::config
