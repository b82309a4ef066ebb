#pragma once

#include <string>

#include "config/config.pb.h"

namespace skycache::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static skycache::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static skycache::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace skycache::config
