#pragma once

#include <string>

#include "config/config.pb.h"

namespace songqueue::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields
  are rejected; Validate() runs on every loaded config.
*/
class ConfigLoader {
 public:
  static songqueue::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error naming the first invalid setting.
  static void Validate(const songqueue::runtime::config::RuntimeConfig& config);
};

} // namespace songqueue::config
