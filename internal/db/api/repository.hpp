#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/deployment_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/node_record.hpp"
#include "internal/db/model/telemetry_sample_record.hpp"
#include "internal/model/node_state.hpp"

namespace netorch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - A node update and its audit event land together or not at all
  - Inserts assign the record id in place

  The DB is the source of truth for:
    deployments
    node lifecycle state
    telemetry
    audit events
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Deployments
  // ---------------------------------------------------------------------

  virtual Result InsertDeployment(Transaction&, model::DeploymentRecord&) = 0;

  virtual std::optional<model::DeploymentRecord> GetDeployment(Transaction&, int64_t id) = 0;

  // Newest first (id descending).
  virtual std::vector<model::DeploymentRecord> ListDeployments(Transaction&, const Pagination&) = 0;

  virtual uint64_t CountDeployments(Transaction&) = 0;

  // Cascades to nodes, telemetry and events.
  virtual Result DeleteDeployment(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Nodes
  // ---------------------------------------------------------------------

  virtual Result InsertNode(Transaction&, model::NodeRecord&) = 0;

  virtual std::optional<model::NodeRecord> GetNode(Transaction&, int64_t id) = 0;

  virtual std::vector<model::NodeRecord> ListNodesByDeployment(Transaction&, int64_t deployment_id) = 0;

  // Every node whose state is in `states`, id ascending.
  virtual std::vector<model::NodeRecord> ListNodesByState(Transaction&, const std::vector<netorch::model::NodeState>& states) = 0;

  virtual uint64_t CountNodes(Transaction&, int64_t deployment_id) = 0;

  virtual Result UpdateNode(Transaction&, const model::NodeRecord&) = 0;

  // ---------------------------------------------------------------------
  // Telemetry
  // ---------------------------------------------------------------------

  virtual Result InsertTelemetrySample(Transaction&, model::TelemetrySampleRecord&) = 0;

  virtual std::vector<model::TelemetrySampleRecord> ListTelemetry(Transaction&, const TelemetryQuery&) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  virtual Result InsertEvent(Transaction&, model::EventRecord&) = 0;

  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const EventQuery&) = 0;

  // ---------------------------------------------------------------------
  // Health
  // ---------------------------------------------------------------------

  // Cheap round trip to the backend.
  virtual bool Ping() = 0;
};

} // namespace netorch::db
