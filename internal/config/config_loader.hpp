#pragma once

#include <string>

#include "config/config.pb.h"

namespace relay::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Keys may use either
  the proto field names or their camelCase JSON names.

  Supported tags:
    !joinPaths [a, b, c]   -> "a/b/c"
    !expandVars "$HOME/x"  -> environment variables substituted
*/
class ConfigLoader {
 public:
  static relay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static relay::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace relay::config
