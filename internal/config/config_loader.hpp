#pragma once

#include <string>

#include "config/config.pb.h"

namespace powerscore::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected here; semantic checks live in ConfigValidator.
*/
class ConfigLoader {
 public:
  static powerscore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static powerscore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace powerscore::config
