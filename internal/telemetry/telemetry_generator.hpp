#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/util/time.hpp"

namespace netorch::telemetry {

struct CollectionStats {
  std::size_t nodes   = 0;
  std::size_t written = 0;
  std::size_t failed  = 0;
};

/*
  Writes one synthetic sample per RUNNING node per cycle.
  Each sample is its own transaction.
*/
class TelemetryGenerator {
 public:
  TelemetryGenerator(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds interval,
                     std::chrono::milliseconds error_backoff);

  CollectionStats RunCycle(util::TimePoint now);

  void Start();
  void Stop();
  bool IsAlive() const;

 private:
  std::shared_ptr<db::Repository> repository_;
  runtime::PeriodicTask           task_;
};

} // namespace netorch::telemetry
