#pragma once

#include <functional>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace commute::config {

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/*
  Builds the immutable RuntimeConfig once at process start.

  Precedence: built-in defaults < YAML file < environment.
  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static commute::runtime::config::RuntimeConfig Defaults();

  static commute::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyEnvironment(const EnvLookup& env, commute::runtime::config::RuntimeConfig* config);

  static commute::runtime::config::RuntimeConfig Load(const std::optional<std::string>& yaml_path, const EnvLookup& env);

  // Throws util::ConfigurationError naming every missing or invalid setting.
  static void Validate(const commute::runtime::config::RuntimeConfig& config);

  static EnvLookup ProcessEnvironment();
};

} // namespace commute::config
