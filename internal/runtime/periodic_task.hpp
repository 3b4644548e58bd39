#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace netorch::runtime {

/*
  Background loop that runs a cycle at a fixed cadence.

  - The first cycle runs as soon as the task starts.
  - A cycle that throws is logged and followed by the error backoff
    instead of the normal interval. The loop keeps going.
  - Stop() wakes the sleeping loop, waits for an in-flight cycle to
    finish and joins the thread.
*/
class PeriodicTask {
 public:
  using Cycle = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::chrono::milliseconds error_backoff, Cycle cycle);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  // True while the loop thread is alive.
  bool IsRunning() const {
    return running_;
  }

  uint64_t CompletedCycles() const {
    return completed_cycles_;
  }

  uint64_t FailedCycles() const {
    return failed_cycles_;
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  void Run();

  // false once a stop was requested
  bool SleepFor(std::chrono::milliseconds delay);

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds error_backoff_;
  Cycle                     cycle_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> completed_cycles_{0};
  std::atomic<uint64_t> failed_cycles_{0};
};

} // namespace netorch::runtime
