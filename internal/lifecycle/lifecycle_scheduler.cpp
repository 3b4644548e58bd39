#include "lifecycle_scheduler.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "lifecycle_policy.hpp"
#include "state_transition.hpp"

namespace netorch::lifecycle {

using netorch::model::NodeState;
using netorch::observability::IntField;
using netorch::observability::StringField;

LifecycleScheduler::LifecycleScheduler(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds poll_interval,
                                       std::chrono::milliseconds error_backoff)
    : repository_(std::move(repository)),
      task_("lifecycle", poll_interval, error_backoff, [this] { RunCycle(util::Now()); }) {
}

CycleStats LifecycleScheduler::RunCycle(util::TimePoint now) {
  observability::SpanScope span("LifecycleScheduler.RunCycle");
  const int64_t            now_ms = util::ToUnixMillis(now);

  std::vector<db::model::NodeRecord> pending;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListNodesByState(*tx, {NodeState::kPending, NodeState::kProvisioning, NodeState::kConfiguring});
  }

  CycleStats stats;
  stats.examined = pending.size();
  for (const auto& node : pending) {
    try {
      if (AdvanceNode(node.id, now_ms)) ++stats.transitioned;
    } catch (const std::exception& e) {
      ++stats.failed;
      NETORCH_LOG_ERROR("Node transition failed", {StringField("node", node.node_id), IntField("deployment_id", node.deployment_id),
                                                   StringField("error", e.what())});
    }
  }

  span.SetAttribute("nodes.examined", static_cast<int64_t>(stats.examined));
  span.SetAttribute("nodes.transitioned", static_cast<int64_t>(stats.transitioned));
  if (stats.transitioned > 0 || stats.failed > 0) {
    NETORCH_LOG_DEBUG("Lifecycle cycle complete", {IntField("examined", static_cast<int64_t>(stats.examined)),
                                                   IntField("transitioned", static_cast<int64_t>(stats.transitioned)),
                                                   IntField("failed", static_cast<int64_t>(stats.failed))});
  }
  return stats;
}

bool LifecycleScheduler::AdvanceNode(int64_t node_id, int64_t now_ms) {
  auto tx = repository_->Begin();

  // re-read inside the write transaction; the listing may be stale
  auto node = repository_->GetNode(*tx, node_id);
  if (!node) return false;

  auto next = NextState(*node, now_ms);
  if (!next) return false;

  const NodeState from = node->state;
  if (from == NodeState::kPending && !node->ip_address) {
    node->ip_address = AssignIpAddress(node->deployment_id, node->id);
  }

  ApplyTransition(*repository_, *tx, *node, *next, now_ms);
  tx->Commit();

  observability::Metrics::Instance().RecordTransition(netorch::model::ToString(from), netorch::model::ToString(*next));
  NETORCH_LOG_INFO("Node transitioned", {StringField("node", node->node_id), IntField("deployment_id", node->deployment_id),
                                         StringField("from", netorch::model::ToString(from)),
                                         StringField("to", netorch::model::ToString(*next))});
  return true;
}

void LifecycleScheduler::Start() {
  task_.Start();
}

void LifecycleScheduler::Stop() {
  task_.Stop();
}

bool LifecycleScheduler::IsAlive() const {
  return task_.IsRunning();
}

} // namespace netorch::lifecycle
