#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/analytics/bottleneck_detector.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/lifecycle_scheduler.hpp"
#include "internal/service/orchestrator_service.hpp"
#include "internal/telemetry/telemetry_generator.hpp"

namespace netorch::factory {

/*
  Application

  Owns every long-lived component of the server. Workers are null when
  disabled in the config.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<analytics::BottleneckDetector> detector;
  std::shared_ptr<lifecycle::LifecycleScheduler> lifecycle;
  std::shared_ptr<telemetry::TelemetryGenerator> telemetry;
  std::shared_ptr<service::OrchestratorService>  orchestrator;

  void StartWorkers();

  // Blocks until in-flight cycles finish.
  void StopWorkers();
};

/*
  Store selection: database.sqlite, database.postgres, or in-memory when
  neither is configured. Creates the schema if it does not exist.

  This is the composition root of the application. It is the ONLY place
  allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const netorch::runtime::config::RuntimeConfig& config);

Application Build(const netorch::runtime::config::RuntimeConfig& config);

} // namespace netorch::factory
