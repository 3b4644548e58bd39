#pragma once

#include <string>

#include "config/config.pb.h"

namespace netorch::config {

inline constexpr const char* kDefaultBindAddress               = "0.0.0.0:50051";
inline constexpr uint32_t    kDefaultLifecyclePollMs           = 2000;
inline constexpr uint32_t    kDefaultTelemetryIntervalMs       = 5000;
inline constexpr uint32_t    kDefaultWorkerErrorBackoffMs      = 5000;
inline constexpr uint32_t    kDefaultPostgresConnections       = 4;
inline constexpr uint32_t    kDefaultAnalysisWindowMinutes     = 10;
inline constexpr double      kDefaultDeviationThreshold        = 2.0;
inline constexpr uint32_t    kMaxAnalysisWindowMinutes         = 60;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Zero-valued knobs are replaced by the defaults above; an
  analysis window over kMaxAnalysisWindowMinutes is rejected.
*/
class ConfigLoader {
 public:
  static netorch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static netorch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(netorch::runtime::config::RuntimeConfig& config);
};

} // namespace netorch::config
