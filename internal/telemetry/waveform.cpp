#include "waveform.hpp"

#include <algorithm>
#include <cmath>

namespace netorch::telemetry {

namespace {

double Round2(double value) {
  return std::round(value * 100.0) / 100.0;
}

} // namespace

bool IsBottleneckProne(int64_t node_id) {
  return node_id % 10 > 7;
}

SampleValues Baseline(int64_t node_id) {
  const double f = static_cast<double>(node_id % 10);

  SampleValues base;
  if (IsBottleneckProne(node_id)) {
    base.latency_ms      = 50.0 + (f - 7.0) * 20.0;
    base.throughput_gbps = 8.0 - (f - 7.0) * 1.5;
    base.error_rate      = 0.5 + (f - 7.0) * 0.3;
  } else {
    base.latency_ms      = 10.0 + f * 2.0;
    base.throughput_gbps = 9.5 - f * 0.1;
    base.error_rate      = 0.1 + f * 0.02;
  }
  return base;
}

SampleValues Synthesize(int64_t node_id, util::TimePoint now) {
  const double seconds = static_cast<double>(util::ToUnixMillis(now)) / 1000.0;
  const double v       = 0.3 * std::sin(seconds / 100.0 + static_cast<double>(node_id));

  const auto base = Baseline(node_id);

  SampleValues out;
  out.latency_ms      = Round2(std::clamp(base.latency_ms * (1.0 + 0.2 * v), kMinLatencyMs, kMaxLatencyMs));
  out.throughput_gbps = Round2(std::clamp(base.throughput_gbps * (1.0 + 0.1 * v), kMinThroughputGbps, kMaxThroughputGbps));
  out.error_rate      = Round2(std::clamp(std::max(0.0, base.error_rate + 0.1 * v), kMinErrorRate, kMaxErrorRate));
  return out;
}

} // namespace netorch::telemetry
