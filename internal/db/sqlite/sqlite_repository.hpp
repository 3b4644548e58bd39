#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace netorch::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
