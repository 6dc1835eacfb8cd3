#pragma once

#include <string>

#include "config/config.pb.h"

namespace labelq::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields get
  their defaults and the result is validated; any problem is reported as
  std::runtime_error.
*/
class ConfigLoader {
 public:
  static labelq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static labelq::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(labelq::runtime::config::RuntimeConfig& config);
  static void Validate(const labelq::runtime::config::RuntimeConfig& config);
};

} // namespace labelq::config
