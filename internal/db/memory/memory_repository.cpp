#include "memory_repository.hpp"

#include <algorithm>
#include <string>

#include "memory_tx.hpp"

namespace netorch::db::memory {

namespace {

void AssignId(std::atomic<int64_t>& sequence, int64_t& id) {
  if (id == 0) {
    id = sequence.fetch_add(1);
    return;
  }
  // caller-provided id: keep the sequence ahead of it
  int64_t expected = sequence.load();
  while (expected <= id && !sequence.compare_exchange_weak(expected, id + 1)) {
  }
}

template <typename Map, typename Pred>
std::vector<typename Map::mapped_type> EraseIf(Map& rows, Pred pred) {
  std::vector<typename Map::mapped_type> removed;
  for (auto it = rows.begin(); it != rows.end();) {
    if (pred(it->second)) {
      removed.push_back(std::move(it->second));
      it = rows.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Deployments
// ------------------------------------------------------------------

Result MemoryRepository::InsertDeployment(Transaction& t, model::DeploymentRecord& r) {
  AssignId(next_deployment_id_, r.id);
  return TX(t).Apply([row = r](State& s, UndoLog& undo) {
    if (s.deployments.contains(row.id)) return Result::Err(ErrorCode::AlreadyExists, "deployment " + std::to_string(row.id));
    s.deployments[row.id] = row;
    undo.push_back([id = row.id](State& st) { st.deployments.erase(id); });
    return Result::Ok();
  });
}

std::optional<model::DeploymentRecord> MemoryRepository::GetDeployment(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.deployments.find(id);
  if (it == s.deployments.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeploymentRecord> MemoryRepository::ListDeployments(Transaction& t, const Pagination& page) {
  const auto&                          s = TX(t).View();
  std::vector<model::DeploymentRecord> out;
  std::size_t                          skipped = 0;
  for (auto it = s.deployments.rbegin(); it != s.deployments.rend() && out.size() < page.limit; ++it) {
    if (skipped++ < page.offset) continue;
    out.push_back(it->second);
  }
  return out;
}

uint64_t MemoryRepository::CountDeployments(Transaction& t) {
  return TX(t).View().deployments.size();
}

Result MemoryRepository::DeleteDeployment(Transaction& t, int64_t id) {
  return TX(t).Apply([id](State& s, UndoLog& undo) {
    auto it = s.deployments.find(id);
    if (it == s.deployments.end()) return Result::Err(ErrorCode::NotFound, "deployment " + std::to_string(id));

    auto deployment = it->second;
    s.deployments.erase(it);
    auto nodes     = EraseIf(s.nodes, [id](const model::NodeRecord& n) { return n.deployment_id == id; });
    auto telemetry = EraseIf(s.telemetry, [id](const model::TelemetrySampleRecord& r) { return r.deployment_id == id; });
    auto events    = EraseIf(s.events, [id](const model::EventRecord& e) { return e.deployment_id == id; });

    undo.push_back([deployment, nodes, telemetry, events](State& st) {
      st.deployments[deployment.id] = deployment;
      for (const auto& n : nodes) st.nodes[n.id] = n;
      for (const auto& r : telemetry) st.telemetry[r.id] = r;
      for (const auto& e : events) st.events[e.id] = e;
    });
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

Result MemoryRepository::InsertNode(Transaction& t, model::NodeRecord& r) {
  AssignId(next_node_id_, r.id);
  return TX(t).Apply([row = r](State& s, UndoLog& undo) {
    if (!s.deployments.contains(row.deployment_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "node references missing deployment " + std::to_string(row.deployment_id));
    }
    if (s.nodes.contains(row.id)) return Result::Err(ErrorCode::AlreadyExists, "node " + std::to_string(row.id));
    for (const auto& [_, node] : s.nodes) {
      if (node.deployment_id == row.deployment_id && node.node_id == row.node_id) {
        return Result::Err(ErrorCode::AlreadyExists, "node identifier " + row.node_id + " already used in deployment");
      }
    }
    s.nodes[row.id] = row;
    undo.push_back([id = row.id](State& st) { st.nodes.erase(id); });
    return Result::Ok();
  });
}

std::optional<model::NodeRecord> MemoryRepository::GetNode(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.nodes.find(id);
  if (it == s.nodes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::NodeRecord> MemoryRepository::ListNodesByDeployment(Transaction& t, int64_t deployment_id) {
  std::vector<model::NodeRecord> out;
  for (const auto& [_, node] : TX(t).View().nodes)
    if (node.deployment_id == deployment_id) out.push_back(node);
  return out;
}

std::vector<model::NodeRecord> MemoryRepository::ListNodesByState(Transaction& t, const std::vector<netorch::model::NodeState>& states) {
  std::vector<model::NodeRecord> out;
  for (const auto& [_, node] : TX(t).View().nodes)
    if (std::find(states.begin(), states.end(), node.state) != states.end()) out.push_back(node);
  return out;
}

uint64_t MemoryRepository::CountNodes(Transaction& t, int64_t deployment_id) {
  const auto& nodes = TX(t).View().nodes;
  return static_cast<uint64_t>(
      std::count_if(nodes.begin(), nodes.end(), [deployment_id](const auto& entry) { return entry.second.deployment_id == deployment_id; }));
}

Result MemoryRepository::UpdateNode(Transaction& t, const model::NodeRecord& r) {
  return TX(t).Apply([row = r](State& s, UndoLog& undo) {
    auto it = s.nodes.find(row.id);
    if (it == s.nodes.end()) return Result::Err(ErrorCode::NotFound, "node " + std::to_string(row.id));
    undo.push_back([previous = it->second](State& st) { st.nodes[previous.id] = previous; });
    it->second = row;
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------------

Result MemoryRepository::InsertTelemetrySample(Transaction& t, model::TelemetrySampleRecord& r) {
  AssignId(next_sample_id_, r.id);
  return TX(t).Apply([row = r](State& s, UndoLog& undo) {
    if (!s.nodes.contains(row.node_id) || !s.deployments.contains(row.deployment_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "telemetry references missing node " + std::to_string(row.node_id));
    }
    s.telemetry[row.id] = row;
    undo.push_back([id = row.id](State& st) { st.telemetry.erase(id); });
    return Result::Ok();
  });
}

std::vector<model::TelemetrySampleRecord> MemoryRepository::ListTelemetry(Transaction& t, const TelemetryQuery& q) {
  const auto& view = TX(t).View();
  if (!view.deployments.contains(q.deployment_id)) return {};

  // keyed by id: after Commit() the transaction's own samples are also committed
  std::map<int64_t, model::TelemetrySampleRecord> matched;
  auto collect = [&](const std::map<int64_t, model::TelemetrySampleRecord>& rows) {
    for (const auto& [id, r] : rows) {
      if (r.deployment_id != q.deployment_id) continue;
      if (q.node_id && r.node_id != *q.node_id) continue;
      if (q.start_ms && r.timestamp_ms < *q.start_ms) continue;
      if (q.end_ms && r.timestamp_ms > *q.end_ms) continue;
      matched.emplace(id, r);
    }
  };
  {
    std::scoped_lock lock(mutex_);
    collect(committed_.telemetry);
  }
  collect(view.telemetry);

  std::vector<model::TelemetrySampleRecord> out;
  out.reserve(matched.size());
  for (auto& [_, r] : matched) out.push_back(std::move(r));

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms > b.timestamp_ms;
    return a.id > b.id;
  });
  if (q.limit && out.size() > *q.limit) out.resize(*q.limit);
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  AssignId(next_event_id_, r.id);
  return TX(t).Apply([row = r](State& s, UndoLog& undo) {
    if (row.deployment_id && !s.deployments.contains(*row.deployment_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "event references missing deployment " + std::to_string(*row.deployment_id));
    }
    if (row.node_id && !s.nodes.contains(*row.node_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "event references missing node " + std::to_string(*row.node_id));
    }
    s.events[row.id] = row;
    undo.push_back([id = row.id](State& st) { st.events.erase(id); });
    return Result::Ok();
  });
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const EventQuery& q) {
  std::vector<model::EventRecord> out;
  for (const auto& [_, e] : TX(t).View().events) {
    if (q.deployment_id && e.deployment_id != q.deployment_id) continue;
    if (q.node_id && e.node_id != q.node_id) continue;
    out.push_back(e);
    if (q.limit && out.size() >= *q.limit) break;
  }
  return out;
}

} // namespace netorch::db::memory
