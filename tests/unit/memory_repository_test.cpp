#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using netorch::db::memory::MemoryRepository;
using netorch::db::model::TelemetrySampleRecord;

constexpr int64_t kStartMs = 1'700'000'000'000;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo          = std::make_shared<MemoryRepository>();
  int64_t                           deployment_id = 0;
  int64_t                           node_id       = 0;
};

Fixture Seed() {
  Fixture f;
  auto    tx = f.repo->Begin();

  netorch::db::model::DeploymentRecord deployment;
  deployment.name              = "fabric";
  deployment.target_node_count = 1;
  assert(f.repo->InsertDeployment(*tx, deployment));

  netorch::db::model::NodeRecord node;
  node.deployment_id = deployment.id;
  node.node_id       = "node-001";
  node.hostname      = "switch-1-001";
  node.state         = netorch::model::NodeState::kRunning;
  assert(f.repo->InsertNode(*tx, node));
  tx->Commit();

  f.deployment_id = deployment.id;
  f.node_id       = node.id;
  return f;
}

TelemetrySampleRecord Sample(const Fixture& f, int64_t timestamp_ms) {
  TelemetrySampleRecord s;
  s.node_id         = f.node_id;
  s.deployment_id   = f.deployment_id;
  s.timestamp_ms    = timestamp_ms;
  s.latency_ms      = 12.5;
  s.throughput_gbps = 9.1;
  s.error_rate      = 0.2;
  return s;
}

std::size_t CountSamples(const Fixture& f, netorch::db::Transaction& tx) {
  netorch::db::TelemetryQuery query;
  query.deployment_id = f.deployment_id;
  return f.repo->ListTelemetry(tx, query).size();
}

void TestOwnSamplesAreVisibleBeforeCommit() {
  auto f = Seed();

  auto writer = f.repo->Begin();
  auto sample = Sample(f, kStartMs);
  assert(f.repo->InsertTelemetrySample(*writer, sample));
  assert(CountSamples(f, *writer) == 1);

  auto reader = f.repo->Begin();
  assert(CountSamples(f, *reader) == 0);

  writer->Commit();
  // no duplicate once the transaction's own sample is also committed
  assert(CountSamples(f, *writer) == 1);
  assert(CountSamples(f, *reader) == 1);
}

void TestRolledBackSamplesDisappear() {
  auto f = Seed();
  {
    auto tx     = f.repo->Begin();
    auto sample = Sample(f, kStartMs);
    assert(f.repo->InsertTelemetrySample(*tx, sample));
    tx->Rollback();
  }
  auto tx = f.repo->Begin();
  assert(CountSamples(f, *tx) == 0);
}

void TestDeleteHidesSamplesInsideTheTransaction() {
  auto f = Seed();
  {
    auto tx     = f.repo->Begin();
    auto sample = Sample(f, kStartMs);
    assert(f.repo->InsertTelemetrySample(*tx, sample));
    tx->Commit();
  }

  auto tx = f.repo->Begin();
  assert(f.repo->DeleteDeployment(*tx, f.deployment_id));
  assert(CountSamples(f, *tx) == 0);

  auto other = f.repo->Begin();
  assert(CountSamples(f, *other) == 1);

  tx->Commit();
  auto after = f.repo->Begin();
  assert(CountSamples(f, *after) == 0);
}

void TestTransactionCostDoesNotGrowWithTelemetry() {
  auto f = Seed();
  {
    auto tx = f.repo->Begin();
    for (int64_t i = 0; i < 200'000; ++i) {
      auto sample = Sample(f, kStartMs + i);
      assert(f.repo->InsertTelemetrySample(*tx, sample));
    }
    tx->Commit();
  }

  // one short write transaction per sample, as the telemetry generator does
  const auto started = std::chrono::steady_clock::now();
  for (int64_t i = 0; i < 2'000; ++i) {
    auto tx     = f.repo->Begin();
    auto sample = Sample(f, kStartMs + 200'000 + i);
    assert(f.repo->InsertTelemetrySample(*tx, sample));
    tx->Commit();
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed < std::chrono::seconds(5));

  auto tx = f.repo->Begin();
  assert(CountSamples(f, *tx) == 202'000);
}

} // namespace

int main() {
  TestOwnSamplesAreVisibleBeforeCommit();
  TestRolledBackSamplesDisappear();
  TestDeleteHidesSamplesInsideTheTransaction();
  TestTransactionCostDoesNotGrowWithTelemetry();

  std::cout << "netorch_unit_memory_repository: pass\n";
  return 0;
}
