#pragma once

#include <string>

#include "config/config.pb.h"

namespace convtree::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing sections fall back to an in-memory database and the
  default tree options.
*/
class ConfigLoader {
 public:
  static convtree::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static convtree::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error describing the first invalid setting.
  static void Validate(const convtree::runtime::config::RuntimeConfig& config);
};

} // namespace convtree::config
