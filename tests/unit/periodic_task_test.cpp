#include "internal/runtime/periodic_task.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

using netorch::runtime::PeriodicTask;
using namespace std::chrono_literals;

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

void TestRejectsInvalidConfiguration() {
  bool threw = false;
  try {
    PeriodicTask task("bad", 0ms, 10ms, [] {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    PeriodicTask task("bad", 10ms, 10ms, nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestRunsCyclesUntilStopped() {
  std::atomic<int> runs{0};
  PeriodicTask     task("counter", 5ms, 5ms, [&] { ++runs; });

  task.Start();
  assert(task.IsRunning());
  assert(WaitUntil([&] { return runs.load() >= 3; }));
  task.Stop();

  assert(!task.IsRunning());
  const int after_stop = runs.load();
  std::this_thread::sleep_for(30ms);
  assert(runs.load() == after_stop);
  assert(task.CompletedCycles() == static_cast<uint64_t>(after_stop));
  assert(task.FailedCycles() == 0);
}

void TestFailingCycleDoesNotKillTheLoop() {
  std::atomic<int> runs{0};
  PeriodicTask     task("flaky", 5ms, 5ms, [&] {
    if (++runs % 2 == 1) throw std::runtime_error("transient");
  });

  task.Start();
  assert(WaitUntil([&] { return task.FailedCycles() >= 2 && task.CompletedCycles() >= 2; }));
  assert(task.IsRunning());
  task.Stop();
}

void TestStopInterruptsLongSleep() {
  PeriodicTask task("sleepy", std::chrono::minutes(10), std::chrono::minutes(10), [] {});
  task.Start();
  assert(WaitUntil([&] { return task.CompletedCycles() == 1; }));

  const auto started = std::chrono::steady_clock::now();
  task.Stop();
  assert(std::chrono::steady_clock::now() - started < 2s);
  assert(task.Name() == "sleepy");
}

void TestStopWithoutStartIsHarmless() {
  PeriodicTask task("idle", 10ms, 10ms, [] {});
  task.Stop();
  assert(!task.IsRunning());
}

} // namespace

int main() {
  TestRejectsInvalidConfiguration();
  TestRunsCyclesUntilStopped();
  TestFailingCycleDoesNotKillTheLoop();
  TestStopInterruptsLongSleep();
  TestStopWithoutStartIsHarmless();

  std::cout << "netorch_unit_periodic_task: pass\n";
  return 0;
}
