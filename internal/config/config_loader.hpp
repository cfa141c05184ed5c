#pragma once

#include <string>

#include "config/config.pb.h"

namespace pipeline::config {

inline constexpr const char* kDefaultWorkspaceId       = "ws_default";
inline constexpr uint32_t    kDefaultConflictRetries   = 5;
inline constexpr uint32_t    kDefaultConflictBackoffMs = 30;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset values are filled from the defaults above and the
  store backend falls back to `memory {}`.
*/
class ConfigLoader {
 public:
  static pipeline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static pipeline::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(pipeline::runtime::config::RuntimeConfig& config);
};

} // namespace pipeline::config
