#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "netorch/v1/types.pb.h"

namespace netorch::analytics {

/*
  Statistical outlier detection over a deployment's recent telemetry.

  Baseline: mean and sample stdev of every sample in the window.
  Per node: mean of its own samples, turned into z-scores against the
  baseline. Throughput is inverted (lower is worse).

    score = 0.4 * max(0, latency_z) + 0.4 * max(0, throughput_z)
          + 0.2 * max(0, error_z)

  A node is reported when any z-score reaches the threshold. Reports are
  ordered by score, worst first.

  Stateless; reads through one transaction per call.
*/
class BottleneckDetector {
 public:
  explicit BottleneckDetector(std::shared_ptr<db::Repository> repository);

  // Throws util::NotFound when the deployment does not exist.
  netorch::v1::BottleneckReport Detect(int64_t deployment_id, std::chrono::minutes window, double deviation_threshold,
                                       util::TimePoint now) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace netorch::analytics
