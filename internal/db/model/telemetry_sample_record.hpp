#pragma once

#include <cstdint>

namespace netorch::db::model {

// Append-only; never updated in place.
struct TelemetrySampleRecord {
  int64_t id            = 0;
  int64_t node_id       = 0;
  int64_t deployment_id = 0;
  int64_t timestamp_ms  = 0;

  double latency_ms      = 0.0;
  double throughput_gbps = 0.0;
  double error_rate      = 0.0; // percent, 0-100
};

}
