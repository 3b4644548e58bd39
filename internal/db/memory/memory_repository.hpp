#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace netorch::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDeployment(Transaction&, model::DeploymentRecord&) override;
  std::optional<model::DeploymentRecord> GetDeployment(Transaction&, int64_t) override;
  std::vector<model::DeploymentRecord> ListDeployments(Transaction&, const Pagination&) override;
  uint64_t CountDeployments(Transaction&) override;
  Result DeleteDeployment(Transaction&, int64_t) override;

  Result InsertNode(Transaction&, model::NodeRecord&) override;
  std::optional<model::NodeRecord> GetNode(Transaction&, int64_t) override;
  std::vector<model::NodeRecord> ListNodesByDeployment(Transaction&, int64_t) override;
  std::vector<model::NodeRecord> ListNodesByState(Transaction&, const std::vector<netorch::model::NodeState>&) override;
  uint64_t CountNodes(Transaction&, int64_t) override;
  Result UpdateNode(Transaction&, const model::NodeRecord&) override;

  Result InsertTelemetrySample(Transaction&, model::TelemetrySampleRecord&) override;
  std::vector<model::TelemetrySampleRecord> ListTelemetry(Transaction&, const TelemetryQuery&) override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const EventQuery&) override;

  bool Ping() override {
    return true;
  }

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::DeploymentRecord>      deployments;
    std::map<int64_t, model::NodeRecord>            nodes;
    std::map<int64_t, model::TelemetrySampleRecord> telemetry;
    std::map<int64_t, model::EventRecord>           events;
  };

  using UndoLog = std::vector<std::function<void(State&)>>;

  // A write is replayed against the committed state at Commit(); on failure the
  // undo log restores whatever earlier writes of the same transaction changed.
  using Mutation = std::function<Result(State&, UndoLog&)>;

  std::mutex mutex_;
  State      committed_;

  // Sequences live outside the snapshot so concurrent transactions never hand
  // out the same id; like database sequences they are not rolled back.
  std::atomic<int64_t> next_deployment_id_{1};
  std::atomic<int64_t> next_node_id_{1};
  std::atomic<int64_t> next_sample_id_{1};
  std::atomic<int64_t> next_event_id_{1};
};

}
