#pragma once

#include <cstdint>

#include "internal/util/time.hpp"

namespace netorch::telemetry {

struct SampleValues {
  double latency_ms      = 0.0;
  double throughput_gbps = 0.0;
  double error_rate      = 0.0;
};

inline constexpr double kMinLatencyMs      = 1.0;
inline constexpr double kMaxLatencyMs      = 200.0;
inline constexpr double kMinThroughputGbps = 1.0;
inline constexpr double kMaxThroughputGbps = 10.0;
inline constexpr double kMinErrorRate      = 0.0;
inline constexpr double kMaxErrorRate      = 5.0;

/*
  Synthetic link metrics.

  Nodes with id % 10 > 7 get a degraded baseline (high latency, low
  throughput, more errors). Every node's values follow a slow sine wave
  over wall-clock time so consecutive samples differ. The output is a pure
  function of (node id, instant).
*/

bool IsBottleneckProne(int64_t node_id);

SampleValues Baseline(int64_t node_id);

// Clamped to the bounds above and rounded to two decimals.
SampleValues Synthesize(int64_t node_id, util::TimePoint now);

} // namespace netorch::telemetry
