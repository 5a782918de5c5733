#pragma once

#include <string>

#include "config/config.pb.h"

namespace eventcache::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected, unset values receive defaults, and the result is validated.
*/
class ConfigLoader {
 public:
  static eventcache::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(eventcache::runtime::config::RuntimeConfig* config);

  // Throws std::invalid_argument naming the offending field.
  static void Validate(const eventcache::runtime::config::RuntimeConfig& config);

  // Reads the key from the environment variable named by api.api_key_env.
  static std::string ResolveApiKey(const eventcache::runtime::config::RuntimeConfig& config);
};

} // namespace eventcache::config
