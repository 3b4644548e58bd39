#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace netorch::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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

  bool Ping() override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
