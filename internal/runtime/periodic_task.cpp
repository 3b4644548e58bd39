#include "periodic_task.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace netorch::runtime {

using netorch::observability::IntField;
using netorch::observability::StringField;

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::chrono::milliseconds error_backoff, Cycle cycle)
    : name_(std::move(name)), interval_(interval), error_backoff_(error_backoff), cycle_(std::move(cycle)) {
  if (!cycle_) {
    throw std::invalid_argument("periodic task " + name_ + " requires a cycle function");
  }
  if (interval_.count() <= 0 || error_backoff_.count() <= 0) {
    throw std::invalid_argument("periodic task " + name_ + " requires positive interval and backoff");
  }
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (thread_.joinable()) return;

  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  thread_  = std::thread(&PeriodicTask::Run, this);

  NETORCH_LOG_INFO("Periodic task started", {StringField("task", name_), IntField("interval_ms", interval_.count())});
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
    NETORCH_LOG_INFO("Periodic task stopped",
                     {StringField("task", name_), IntField("completed_cycles", static_cast<int64_t>(completed_cycles_.load())),
                      IntField("failed_cycles", static_cast<int64_t>(failed_cycles_.load()))});
  }
}

bool PeriodicTask::SleepFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, delay, [this] { return stop_requested_; });
}

void PeriodicTask::Run() {
  for (;;) {
    {
      std::lock_guard lock(mutex_);
      if (stop_requested_) break;
    }

    const auto started_at = std::chrono::steady_clock::now();
    auto       delay      = interval_;
    try {
      cycle_();
      ++completed_cycles_;
    } catch (const std::exception& e) {
      ++failed_cycles_;
      delay = error_backoff_;
      NETORCH_LOG_ERROR("Periodic task cycle failed", {StringField("task", name_), StringField("error", e.what()),
                                                       IntField("backoff_ms", error_backoff_.count())});
    }
    netorch::observability::Metrics::Instance().ObserveCycleDurationMs(
        name_, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

    if (!SleepFor(delay)) break;
  }
  running_ = false;
}

} // namespace netorch::runtime
