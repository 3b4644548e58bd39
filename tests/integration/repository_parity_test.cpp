#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"

namespace {

using netorch::db::ErrorCode;
using netorch::db::Repository;
using netorch::db::model::DeploymentRecord;
using netorch::db::model::EventRecord;
using netorch::db::model::NodeRecord;
using netorch::db::model::TelemetrySampleRecord;
using netorch::model::NodeState;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

DeploymentRecord InsertDeployment(Repository& repo, netorch::db::Transaction& tx, const std::string& name) {
  DeploymentRecord d;
  d.name              = name;
  d.description       = "parity";
  d.target_node_count = 2;
  d.created_at_ms     = NowMs();
  d.updated_at_ms     = d.created_at_ms;
  assert(repo.InsertDeployment(tx, d));
  assert(d.id > 0);
  return d;
}

NodeRecord InsertNode(Repository& repo, netorch::db::Transaction& tx, int64_t deployment_id, const std::string& node_id,
                      NodeState state = NodeState::kPending) {
  NodeRecord n;
  n.deployment_id       = deployment_id;
  n.node_id             = node_id;
  n.hostname            = "switch-" + node_id;
  n.state               = state;
  n.created_at_ms       = NowMs();
  n.updated_at_ms       = n.created_at_ms;
  n.state_changed_at_ms = n.created_at_ms;
  assert(repo.InsertNode(tx, n));
  assert(n.id > 0);
  return n;
}

void VerifyDeploymentReadWrite(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const uint64_t before = repo.CountDeployments(*tx);
  auto           first  = InsertDeployment(repo, *tx, prefix + "-first");
  auto           second = InsertDeployment(repo, *tx, prefix + "-second");
  assert(second.id > first.id);
  assert(repo.CountDeployments(*tx) == before + 2);

  auto read = repo.GetDeployment(*tx, first.id);
  assert(read.has_value());
  assert(read->name == prefix + "-first");
  assert(read->description == "parity");
  assert(read->target_node_count == 2);
  assert(read->created_at_ms == first.created_at_ms);

  netorch::db::Pagination page;
  page.limit  = 2;
  page.offset = 0;
  auto newest = repo.ListDeployments(*tx, page);
  assert(newest.size() == 2);
  assert(newest[0].id == second.id);
  assert(newest[1].id == first.id);

  page.limit  = 1;
  page.offset = 1;
  auto paged  = repo.ListDeployments(*tx, page);
  assert(paged.size() == 1);
  assert(paged[0].id == first.id);

  assert(!repo.GetDeployment(*tx, second.id + 1000000).has_value());
  tx->Commit();
}

void VerifyNodeReadWrite(Repository& repo, const std::string& prefix) {
  int64_t deployment_id = 0;
  int64_t first_id      = 0;
  {
    auto tx         = repo.Begin();
    auto deployment = InsertDeployment(repo, *tx, prefix + "-nodes");
    deployment_id   = deployment.id;

    auto a   = InsertNode(repo, *tx, deployment_id, "node-001");
    auto b   = InsertNode(repo, *tx, deployment_id, "node-002", NodeState::kProvisioning);
    first_id = a.id;
    assert(b.id > a.id);
    assert(repo.CountNodes(*tx, deployment_id) == 2);

    auto read = repo.GetNode(*tx, a.id);
    assert(read.has_value());
    assert(read->state == NodeState::kPending);
    assert(!read->ip_address.has_value());
    assert(read->hostname == "switch-node-001");

    auto listed = repo.ListNodesByDeployment(*tx, deployment_id);
    assert(listed.size() == 2);
    assert(listed[0].node_id == "node-001");
    assert(listed[1].node_id == "node-002");

    read->state               = NodeState::kProvisioning;
    read->ip_address          = "10.0.1.1";
    read->state_changed_at_ms = read->state_changed_at_ms + 5;
    assert(repo.UpdateNode(*tx, *read));

    auto updated = repo.GetNode(*tx, a.id);
    assert(updated->state == NodeState::kProvisioning);
    assert(updated->ip_address.value_or("") == "10.0.1.1");
    assert(updated->state_changed_at_ms == read->state_changed_at_ms);
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto by_state = repo.ListNodesByState(*tx, {NodeState::kProvisioning});
    std::vector<int64_t> ours;
    for (const auto& n : by_state) {
      if (n.deployment_id == deployment_id) ours.push_back(n.id);
    }
    assert(ours.size() == 2);
    assert(ours[0] == first_id);
    assert(repo.ListNodesByState(*tx, {NodeState::kRunning, NodeState::kFailed}).size() <
           repo.ListNodesByState(*tx, {NodeState::kRunning, NodeState::kFailed, NodeState::kProvisioning}).size());
    tx->Commit();
  }

  // each failing write gets its own transaction: postgres aborts the rest of a failed one
  {
    auto       tx  = repo.Begin();
    NodeRecord dup;
    dup.deployment_id = deployment_id;
    dup.node_id       = "node-001";
    dup.hostname      = "dup";
    auto result       = repo.InsertNode(*tx, dup);
    assert(!result);
    assert(result.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    auto       tx = repo.Begin();
    NodeRecord orphan;
    orphan.deployment_id = deployment_id + 1000000;
    orphan.node_id       = "node-001";
    orphan.hostname      = "orphan";
    auto result          = repo.InsertNode(*tx, orphan);
    assert(!result);
    assert(result.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }
  {
    auto       tx = repo.Begin();
    NodeRecord missing;
    missing.id            = first_id + 1000000;
    missing.deployment_id = deployment_id;
    missing.node_id       = "ghost";
    missing.hostname      = "ghost";
    auto result           = repo.UpdateNode(*tx, missing);
    assert(!result);
    assert(result.code == ErrorCode::NotFound);
    tx->Rollback();
  }
}

void VerifyTelemetryQueries(Repository& repo, const std::string& prefix) {
  auto tx         = repo.Begin();
  auto deployment = InsertDeployment(repo, *tx, prefix + "-telemetry");
  auto a          = InsertNode(repo, *tx, deployment.id, "node-001", NodeState::kRunning);
  auto b          = InsertNode(repo, *tx, deployment.id, "node-002", NodeState::kRunning);

  for (int i = 0; i < 4; ++i) {
    for (const auto& node : {a, b}) {
      TelemetrySampleRecord s;
      s.node_id         = node.id;
      s.deployment_id   = deployment.id;
      s.timestamp_ms    = 10'000 + i * 1000;
      s.latency_ms      = 10.0 + i;
      s.throughput_gbps = 9.25;
      s.error_rate      = 0.5;
      assert(repo.InsertTelemetrySample(*tx, s));
      assert(s.id > 0);
    }
  }

  netorch::db::TelemetryQuery query;
  query.deployment_id = deployment.id;
  auto all            = repo.ListTelemetry(*tx, query);
  assert(all.size() == 8);
  assert(all[0].timestamp_ms == 13'000);
  assert(all[7].timestamp_ms == 10'000);
  for (std::size_t i = 1; i < all.size(); ++i) assert(all[i - 1].timestamp_ms >= all[i].timestamp_ms);
  assert(all[0].throughput_gbps == 9.25);

  query.node_id = a.id;
  auto only_a   = repo.ListTelemetry(*tx, query);
  assert(only_a.size() == 4);
  for (const auto& s : only_a) assert(s.node_id == a.id);

  // bounds are inclusive
  query.start_ms = 11'000;
  query.end_ms   = 12'000;
  auto ranged    = repo.ListTelemetry(*tx, query);
  assert(ranged.size() == 2);
  assert(ranged[0].latency_ms == 12.0);
  assert(ranged[1].latency_ms == 11.0);

  query.node_id.reset();
  query.end_ms.reset();
  query.limit = 3;
  auto limited = repo.ListTelemetry(*tx, query);
  assert(limited.size() == 3);
  assert(limited[0].timestamp_ms == 13'000);

  tx->Commit();
}

void VerifyEventsAndCascade(Repository& repo, const std::string& prefix) {
  int64_t deployment_id = 0;
  int64_t node_id       = 0;
  {
    auto tx         = repo.Begin();
    auto deployment = InsertDeployment(repo, *tx, prefix + "-events");
    auto node       = InsertNode(repo, *tx, deployment.id, "node-001", NodeState::kRunning);
    deployment_id   = deployment.id;
    node_id         = node.id;

    EventRecord created;
    created.deployment_id = deployment.id;
    created.event_type    = netorch::db::model::kEventDeploymentCreated;
    created.message       = "created";
    created.metadata      = R"({"target_node_count":2})";
    created.created_at_ms = NowMs();
    assert(repo.InsertEvent(*tx, created));

    EventRecord change;
    change.deployment_id = deployment.id;
    change.node_id       = node.id;
    change.event_type    = netorch::db::model::kEventStateChange;
    change.message       = "changed";
    change.created_at_ms = NowMs();
    assert(repo.InsertEvent(*tx, change));
    assert(change.id > created.id);

    TelemetrySampleRecord s;
    s.node_id       = node.id;
    s.deployment_id = deployment.id;
    s.timestamp_ms  = NowMs();
    assert(repo.InsertTelemetrySample(*tx, s));
    tx->Commit();
  }

  {
    auto                    tx = repo.Begin();
    netorch::db::EventQuery query;
    query.deployment_id = deployment_id;
    auto events         = repo.ListEvents(*tx, query);
    assert(events.size() == 2);
    assert(events[0].event_type == "DEPLOYMENT_CREATED");
    assert(!events[0].node_id.has_value());
    assert(events[0].metadata == R"({"target_node_count":2})");
    assert(events[1].node_id.value_or(0) == node_id);

    query.node_id = node_id;
    assert(repo.ListEvents(*tx, query).size() == 1);

    query.node_id.reset();
    query.limit = 1;
    auto limited = repo.ListEvents(*tx, query);
    assert(limited.size() == 1);
    assert(limited[0].event_type == "DEPLOYMENT_CREATED");
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteDeployment(*tx, deployment_id));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.GetDeployment(*tx, deployment_id).has_value());
    assert(!repo.GetNode(*tx, node_id).has_value());
    assert(repo.ListNodesByDeployment(*tx, deployment_id).empty());

    netorch::db::TelemetryQuery telemetry;
    telemetry.deployment_id = deployment_id;
    assert(repo.ListTelemetry(*tx, telemetry).empty());

    netorch::db::EventQuery events;
    events.deployment_id = deployment_id;
    assert(repo.ListEvents(*tx, events).empty());

    auto again = repo.DeleteDeployment(*tx, deployment_id);
    assert(again.code == ErrorCode::NotFound);
    tx->Rollback();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  int64_t id = 0;
  {
    auto tx         = repo.Begin();
    auto deployment = InsertDeployment(repo, *tx, prefix + "-rollback");
    id              = deployment.id;
    // reads see the transaction's own writes
    assert(repo.GetDeployment(*tx, id).has_value());
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetDeployment(*tx, id).has_value());
    tx->Commit();
  }

  // an abandoned transaction rolls back on destruction
  {
    auto tx         = repo.Begin();
    auto deployment = InsertDeployment(repo, *tx, prefix + "-abandoned");
    id              = deployment.id;
  }
  auto tx = repo.Begin();
  assert(!repo.GetDeployment(*tx, id).has_value());
  tx->Commit();
}

void VerifyConcurrentWriters(Repository& repo, const std::string& prefix) {
  int64_t deployment_id = 0;
  {
    auto tx       = repo.Begin();
    deployment_id = InsertDeployment(repo, *tx, prefix + "-concurrent").id;
    tx->Commit();
  }

  constexpr int            kThreads = 4;
  constexpr int            kWrites  = 10;
  std::atomic<int>         failures{0};
  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      for (int i = 0; i < kWrites; ++i) {
        auto        tx = repo.Begin();
        EventRecord e;
        e.deployment_id = deployment_id;
        e.event_type    = "STATE_CHANGE";
        e.message       = "writer " + std::to_string(t) + " #" + std::to_string(i);
        e.created_at_ms = NowMs();
        if (!repo.InsertEvent(*tx, e)) {
          ++failures;
          continue;
        }
        tx->Commit();
      }
    });
  }
  for (auto& w : writers) w.join();
  assert(failures.load() == 0);

  auto                    tx = repo.Begin();
  netorch::db::EventQuery query;
  query.deployment_id = deployment_id;
  assert(repo.ListEvents(*tx, query).size() == static_cast<std::size_t>(kThreads * kWrites));
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto    repo          = backend.make_repository();
  int64_t deployment_id = 0;
  {
    auto tx       = repo->Begin();
    deployment_id = InsertDeployment(*repo, *tx, prefix + "-durable").id;
    InsertNode(*repo, *tx, deployment_id, "node-001", NodeState::kConfiguring);
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto d  = repo->GetDeployment(*tx, deployment_id);
  assert(d.has_value());
  assert(d->name == prefix + "-durable");
  auto nodes = repo->ListNodesByDeployment(*tx, deployment_id);
  assert(nodes.size() == 1);
  assert(nodes[0].state == NodeState::kConfiguring);
  tx->Commit();
}

netorch::runtime::config::RuntimeConfig MemoryConfig() {
  return netorch::runtime::config::RuntimeConfig{};
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return netorch::factory::BuildRepository(MemoryConfig()); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if NETORCH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("netorch_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    netorch::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return netorch::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if NETORCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("NETORCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("NETORCH_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    netorch::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
    return netorch::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const std::string prefix = backend.name + "-" + std::to_string(NowMs());

  {
    auto repo = backend.make_repository();
    assert(repo->Ping());

    VerifyDeploymentReadWrite(*repo, prefix);
    VerifyNodeReadWrite(*repo, prefix);
    VerifyTelemetryQueries(*repo, prefix);
    VerifyEventsAndCascade(*repo, prefix);
    VerifyRollbackBehavior(*repo, prefix);
    VerifyConcurrentWriters(*repo, prefix);
  }

  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if NETORCH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if NETORCH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "netorch_integration_repository_parity: pass\n";
  return 0;
}
