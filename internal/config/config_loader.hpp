#pragma once

#include <string>

#include "config/config.pb.h"

namespace tasktree::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Zero / absent tunables are replaced by their defaults.
*/
class ConfigLoader {
 public:
  static tasktree::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(tasktree::runtime::config::RuntimeConfig& config);
};

} // namespace tasktree::config
