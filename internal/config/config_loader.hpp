#pragma once

#include <string>

#include "config/config.pb.h"

namespace chunkscribe::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected. Fields left at zero are filled from
  defaults.hpp, so callers never see an unset tunable.
*/
class ConfigLoader {
 public:
  static chunkscribe::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static chunkscribe::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills zero-valued fields with built-in defaults, then validates ranges.
  static void ApplyDefaults(chunkscribe::runtime::config::RuntimeConfig& config);
};

} // namespace chunkscribe::config
