#pragma once

#include <string>

#include "config/config.pb.h"

namespace draft::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, printed as JSON, then parsed into
  the RuntimeConfig message. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static draft::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static draft::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace draft::config
