#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/util/time.hpp"

namespace netorch::lifecycle {

struct CycleStats {
  std::size_t examined     = 0;
  std::size_t transitioned = 0;
  std::size_t failed       = 0; // per-node errors, logged and skipped
};

/*
  Drives every non-terminal node through the lifecycle state machine.

  Each cycle applies at most one transition per node, each in its own
  transaction. Re-running a cycle is safe: the rules only look at the
  persisted state.
*/
class LifecycleScheduler {
 public:
  LifecycleScheduler(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds poll_interval,
                     std::chrono::milliseconds error_backoff);

  // One pass over PENDING/PROVISIONING/CONFIGURING nodes.
  // Store errors while listing nodes propagate; per-node errors do not.
  CycleStats RunCycle(util::TimePoint now);

  void Start();
  void Stop();
  bool IsAlive() const;

 private:
  // true if a transition was committed
  bool AdvanceNode(int64_t node_id, int64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  runtime::PeriodicTask           task_;
};

} // namespace netorch::lifecycle
