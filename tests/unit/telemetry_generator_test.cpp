#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/telemetry/telemetry_generator.hpp"
#include "internal/telemetry/waveform.hpp"
#include "internal/util/time.hpp"
#include "failing_repository.hpp"

namespace {

using netorch::db::memory::MemoryRepository;
using netorch::model::NodeState;
using netorch::telemetry::TelemetryGenerator;

constexpr int64_t kStartMs = 1'700'000'000'000;

bool HasTwoDecimals(double value) {
  return std::abs(value * 100.0 - std::round(value * 100.0)) < 1e-6;
}

void AddNode(MemoryRepository& repo, netorch::db::Transaction& tx, int64_t deployment_id, int64_t id, NodeState state) {
  netorch::db::model::NodeRecord node;
  node.id                  = id;
  node.deployment_id       = deployment_id;
  node.node_id             = "node-" + std::to_string(id);
  node.hostname            = "switch-" + std::to_string(id);
  node.state               = state;
  node.created_at_ms       = kStartMs;
  node.updated_at_ms       = kStartMs;
  node.state_changed_at_ms = kStartMs;
  assert(repo.InsertNode(tx, node));
}

void TestSamplesStayWithinBounds() {
  for (int64_t id = 1; id <= 200; ++id) {
    for (int64_t step = 0; step < 50; ++step) {
      const auto v = netorch::telemetry::Synthesize(id, netorch::util::FromUnixMillis(kStartMs + step * 37'000));
      assert(v.latency_ms >= netorch::telemetry::kMinLatencyMs && v.latency_ms <= netorch::telemetry::kMaxLatencyMs);
      assert(v.throughput_gbps >= netorch::telemetry::kMinThroughputGbps && v.throughput_gbps <= netorch::telemetry::kMaxThroughputGbps);
      assert(v.error_rate >= netorch::telemetry::kMinErrorRate && v.error_rate <= netorch::telemetry::kMaxErrorRate);
      assert(HasTwoDecimals(v.latency_ms));
      assert(HasTwoDecimals(v.throughput_gbps));
      assert(HasTwoDecimals(v.error_rate));
    }
  }
}

void TestProneNodesHaveDegradedBaseline() {
  assert(netorch::telemetry::IsBottleneckProne(8));
  assert(netorch::telemetry::IsBottleneckProne(19));
  assert(!netorch::telemetry::IsBottleneckProne(7));
  assert(!netorch::telemetry::IsBottleneckProne(10));

  const auto healthy = netorch::telemetry::Baseline(3);
  const auto prone   = netorch::telemetry::Baseline(9);
  assert(std::abs(healthy.latency_ms - 16.0) < 1e-9);
  assert(std::abs(prone.latency_ms - 90.0) < 1e-9);
  assert(prone.throughput_gbps < healthy.throughput_gbps);
  assert(prone.error_rate > healthy.error_rate);
}

void TestSynthesisIsDeterministic() {
  const auto at = netorch::util::FromUnixMillis(kStartMs);
  const auto a  = netorch::telemetry::Synthesize(42, at);
  const auto b  = netorch::telemetry::Synthesize(42, at);
  assert(a.latency_ms == b.latency_ms);
  assert(a.throughput_gbps == b.throughput_gbps);
  assert(a.error_rate == b.error_rate);
}

void TestCycleWritesOneSamplePerRunningNode() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    auto                                tx = repo->Begin();
    netorch::db::model::DeploymentRecord deployment;
    deployment.name              = "fabric";
    deployment.target_node_count = 3;
    assert(repo->InsertDeployment(*tx, deployment));
    AddNode(*repo, *tx, deployment.id, 1, NodeState::kRunning);
    AddNode(*repo, *tx, deployment.id, 2, NodeState::kRunning);
    AddNode(*repo, *tx, deployment.id, 3, NodeState::kConfiguring);
    tx->Commit();
  }

  TelemetryGenerator generator(repo, std::chrono::milliseconds(1000), std::chrono::milliseconds(1000));
  const auto         now   = netorch::util::FromUnixMillis(kStartMs);
  auto               stats = generator.RunCycle(now);
  assert(stats.nodes == 2);
  assert(stats.written == 2);
  assert(stats.failed == 0);

  auto                       tx = repo->Begin();
  netorch::db::TelemetryQuery query;
  query.deployment_id = 1;
  auto samples        = repo->ListTelemetry(*tx, query);
  assert(samples.size() == 2);
  for (const auto& s : samples) {
    assert(s.node_id == 1 || s.node_id == 2);
    assert(s.timestamp_ms == kStartMs);
    const auto expected = netorch::telemetry::Synthesize(s.node_id, now);
    assert(s.latency_ms == expected.latency_ms);
  }
}

void TestOneFailingNodeDoesNotStopTheCycle() {
  auto memory = std::make_shared<MemoryRepository>();
  {
    auto                                 tx = memory->Begin();
    netorch::db::model::DeploymentRecord deployment;
    deployment.name              = "fabric";
    deployment.target_node_count = 3;
    assert(memory->InsertDeployment(*tx, deployment));
    AddNode(*memory, *tx, deployment.id, 1, NodeState::kRunning);
    AddNode(*memory, *tx, deployment.id, 2, NodeState::kRunning);
    AddNode(*memory, *tx, deployment.id, 3, NodeState::kRunning);
    tx->Commit();
  }
  auto repo = std::make_shared<netorch::testing::FailingRepository>(memory, std::set<int64_t>{1});

  TelemetryGenerator generator(repo, std::chrono::milliseconds(1000), std::chrono::milliseconds(1000));
  for (int64_t cycle = 0; cycle < 3; ++cycle) {
    auto stats = generator.RunCycle(netorch::util::FromUnixMillis(kStartMs + cycle * 5000));
    assert(stats.nodes == 3);
    assert(stats.written == 2);
    assert(stats.failed == 1);
  }

  auto                        tx = memory->Begin();
  netorch::db::TelemetryQuery query;
  query.deployment_id = 1;
  auto samples        = memory->ListTelemetry(*tx, query);
  assert(samples.size() == 6);
  for (const auto& s : samples) assert(s.node_id == 2 || s.node_id == 3);
}

void TestCycleWithNoRunningNodesWritesNothing() {
  auto               repo = std::make_shared<MemoryRepository>();
  TelemetryGenerator generator(repo, std::chrono::milliseconds(1000), std::chrono::milliseconds(1000));
  auto               stats = generator.RunCycle(netorch::util::FromUnixMillis(kStartMs));
  assert(stats.nodes == 0);
  assert(stats.written == 0);
}

} // namespace

int main() {
  TestSamplesStayWithinBounds();
  TestProneNodesHaveDegradedBaseline();
  TestSynthesisIsDeterministic();
  TestCycleWritesOneSamplePerRunningNode();
  TestOneFailingNodeDoesNotStopTheCycle();
  TestCycleWithNoRunningNodesWritesNothing();

  std::cout << "netorch_unit_telemetry_generator: pass\n";
  return 0;
}
