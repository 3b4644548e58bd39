#pragma once

#include <cstdint>
#include <memory>

namespace netorch::db { class Repository; }
namespace netorch::analytics { class BottleneckDetector; }
namespace netorch::lifecycle { class LifecycleScheduler; }
namespace netorch::telemetry { class TelemetryGenerator; }

namespace netorch::service {

/*
  Dependency container shared by all services.

  lifecycle / telemetry may be null when the worker is disabled; Health
  then reports it as not alive.
*/
struct ServiceContext {
  std::shared_ptr<netorch::db::Repository> repository;
  std::shared_ptr<netorch::analytics::BottleneckDetector> detector;
  std::shared_ptr<netorch::lifecycle::LifecycleScheduler> lifecycle;
  std::shared_ptr<netorch::telemetry::TelemetryGenerator> telemetry;

  uint32_t default_window_minutes = 10;
  double default_deviation_threshold = 2.0;
};

}
