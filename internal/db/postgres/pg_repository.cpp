#include "pg_repository.hpp"

#include <stdexcept>
#include <string>

namespace netorch::db::postgres {

namespace {

std::optional<int64_t> ToParam(const std::optional<std::size_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

std::optional<int64_t> OptionalI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<int64_t>();
}

netorch::model::NodeState ParseState(const pqxx::field& f) {
  auto state = netorch::model::ParseNodeState(f.c_str());
  if (!state) throw std::runtime_error("unknown node state in store: " + std::string(f.c_str()));
  return *state;
}

// text[] literal; state names are plain upper-case identifiers
std::string StateArray(const std::vector<netorch::model::NodeState>& states) {
  std::string out = "{";
  for (std::size_t i = 0; i < states.size(); ++i) {
    if (i > 0) out += ',';
    out += netorch::model::ToString(states[i]);
  }
  out += '}';
  return out;
}

model::DeploymentRecord ReadDeployment(const pqxx::row& row) {
  model::DeploymentRecord r;
  r.id                = row[0].as<int64_t>();
  r.name              = row[1].c_str();
  r.description       = row[2].c_str();
  r.target_node_count = row[3].as<uint32_t>();
  r.created_at_ms     = row[4].as<int64_t>();
  r.updated_at_ms     = row[5].as<int64_t>();
  return r;
}

model::NodeRecord ReadNode(const pqxx::row& row) {
  model::NodeRecord r;
  r.id            = row[0].as<int64_t>();
  r.deployment_id = row[1].as<int64_t>();
  r.node_id       = row[2].c_str();
  r.hostname      = row[3].c_str();
  r.state         = ParseState(row[4]);
  if (!row[5].is_null()) r.ip_address = row[5].c_str();
  r.created_at_ms       = row[6].as<int64_t>();
  r.updated_at_ms       = row[7].as<int64_t>();
  r.state_changed_at_ms = row[8].as<int64_t>();
  return r;
}

model::TelemetrySampleRecord ReadSample(const pqxx::row& row) {
  model::TelemetrySampleRecord r;
  r.id              = row[0].as<int64_t>();
  r.node_id         = row[1].as<int64_t>();
  r.deployment_id   = row[2].as<int64_t>();
  r.timestamp_ms    = row[3].as<int64_t>();
  r.latency_ms      = row[4].as<double>();
  r.throughput_gbps = row[5].as<double>();
  r.error_rate      = row[6].as<double>();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.id            = row[0].as<int64_t>();
  r.deployment_id = OptionalI64(row[1]);
  r.node_id       = OptionalI64(row[2]);
  r.event_type    = row[3].c_str();
  r.message       = row[4].c_str();
  r.metadata      = row[5].is_null() ? "" : row[5].c_str();
  r.created_at_ms = row[6].as<int64_t>();
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(const pqxx::result& res, Reader reader) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(reader(row));
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Deployments
// ------------------------------------------------------------------

Result PgRepository::InsertDeployment(Transaction& t, model::DeploymentRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_deployment", r.name, r.description, static_cast<int64_t>(r.target_node_count),
                                          r.created_at_ms, r.updated_at_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeploymentRecord> PgRepository::GetDeployment(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_deployment", id);
  if (res.empty()) return std::nullopt;
  return ReadDeployment(res[0]);
}

std::vector<model::DeploymentRecord> PgRepository::ListDeployments(Transaction& t, const Pagination& page) {
  auto res = TX(t).Work().exec_prepared("list_deployments", static_cast<int64_t>(page.limit), static_cast<int64_t>(page.offset));
  return ReadAll<model::DeploymentRecord>(res, ReadDeployment);
}

uint64_t PgRepository::CountDeployments(Transaction& t) {
  return TX(t).Work().exec_prepared("count_deployments")[0][0].as<uint64_t>();
}

Result PgRepository::DeleteDeployment(Transaction& t, int64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_deployment", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "deployment " + std::to_string(id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

Result PgRepository::InsertNode(Transaction& t, model::NodeRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_node", r.deployment_id, r.node_id, r.hostname,
                                          std::string(netorch::model::ToString(r.state)), r.ip_address, r.created_at_ms,
                                          r.updated_at_ms, r.state_changed_at_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::NodeRecord> PgRepository::GetNode(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_node", id);
  if (res.empty()) return std::nullopt;
  return ReadNode(res[0]);
}

std::vector<model::NodeRecord> PgRepository::ListNodesByDeployment(Transaction& t, int64_t deployment_id) {
  return ReadAll<model::NodeRecord>(TX(t).Work().exec_prepared("list_nodes_by_deployment", deployment_id), ReadNode);
}

std::vector<model::NodeRecord> PgRepository::ListNodesByState(Transaction& t, const std::vector<netorch::model::NodeState>& states) {
  if (states.empty()) return {};
  return ReadAll<model::NodeRecord>(TX(t).Work().exec_prepared("list_nodes_by_state", StateArray(states)), ReadNode);
}

uint64_t PgRepository::CountNodes(Transaction& t, int64_t deployment_id) {
  return TX(t).Work().exec_prepared("count_nodes", deployment_id)[0][0].as<uint64_t>();
}

Result PgRepository::UpdateNode(Transaction& t, const model::NodeRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_node", r.id, r.hostname, std::string(netorch::model::ToString(r.state)),
                                          r.ip_address, r.updated_at_ms, r.state_changed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "node " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------------

Result PgRepository::InsertTelemetrySample(Transaction& t, model::TelemetrySampleRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_sample", r.node_id, r.deployment_id, r.timestamp_ms, r.latency_ms,
                                          r.throughput_gbps, r.error_rate);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TelemetrySampleRecord> PgRepository::ListTelemetry(Transaction& t, const TelemetryQuery& q) {
  auto res = TX(t).Work().exec_prepared("list_telemetry", q.deployment_id, q.node_id, q.start_ms, q.end_ms, ToParam(q.limit));
  return ReadAll<model::TelemetrySampleRecord>(res, ReadSample);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_event", r.deployment_id, r.node_id, r.event_type, r.message, r.metadata,
                                          r.created_at_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ListEvents(Transaction& t, const EventQuery& q) {
  auto res = TX(t).Work().exec_prepared("list_events", q.deployment_id, q.node_id, ToParam(q.limit));
  return ReadAll<model::EventRecord>(res, ReadEvent);
}

// ------------------------------------------------------------------
// Health
// ------------------------------------------------------------------

bool PgRepository::Ping() {
  try {
    auto                 conn = pool_->Acquire();
    pqxx::nontransaction tx(*conn);
    tx.exec("SELECT 1");
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

} // namespace netorch::db::postgres
