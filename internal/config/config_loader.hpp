#pragma once

#include <string>

#include "config/config.pb.h"

namespace scout::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  and wrongly typed values are rejected by the message schema. All
  failures throw util::InvalidArgument.
*/
class ConfigLoader {
 public:
  static scout::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static scout::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Semantic checks the schema cannot express (CIDR syntax, budget shares, port numbers).
  static void Validate(const scout::runtime::config::RuntimeConfig& config);
};

} // namespace scout::config
