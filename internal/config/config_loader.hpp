#pragma once

#include <string>

#include "config/config.pb.h"

namespace brokerstore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Durations use the protobuf JSON form ("0.250s").

  Throws std::runtime_error on unreadable or invalid input.
*/
class ConfigLoader {
 public:
  static brokerstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static brokerstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace brokerstore::config
