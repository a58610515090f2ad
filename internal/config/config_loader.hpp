#pragma once

#include <string>

#include "config/config.pb.h"

namespace masterplan::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields the file
  leaves out are filled from ApplyDefaults, and the result is checked
  by Validate before it is returned.
*/
class ConfigLoader {
 public:
  static masterplan::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static masterplan::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(masterplan::runtime::config::RuntimeConfig* config);
  static void Validate(const masterplan::runtime::config::RuntimeConfig& config);
};

} // namespace masterplan::config
