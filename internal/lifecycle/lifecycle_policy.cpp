#include "lifecycle_policy.hpp"

namespace netorch::lifecycle {

using netorch::model::NodeState;

std::chrono::seconds ProvisioningDuration(int64_t node_id) {
  return std::chrono::seconds(3 + node_id % 5);
}

std::chrono::seconds ConfiguringDuration(int64_t node_id) {
  return std::chrono::seconds(5 + node_id % 7);
}

bool FailsConfiguration(int64_t node_id, int64_t deployment_id) {
  return (node_id + deployment_id) % 20 == 0;
}

std::string AssignIpAddress(int64_t deployment_id, int64_t node_id) {
  return "10.0." + std::to_string(deployment_id) + "." + std::to_string(node_id % 255);
}

static bool Elapsed(const db::model::NodeRecord& node, int64_t now_ms, std::chrono::seconds duration) {
  return now_ms - node.state_changed_at_ms >= std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::optional<NodeState> NextState(const db::model::NodeRecord& node, int64_t now_ms) {
  switch (node.state) {
    case NodeState::kPending:
      return NodeState::kProvisioning;

    case NodeState::kProvisioning:
      if (Elapsed(node, now_ms, ProvisioningDuration(node.id))) return NodeState::kConfiguring;
      return std::nullopt;

    case NodeState::kConfiguring:
      if (!Elapsed(node, now_ms, ConfiguringDuration(node.id))) return std::nullopt;
      return FailsConfiguration(node.id, node.deployment_id) ? NodeState::kFailed : NodeState::kRunning;

    case NodeState::kRunning:
    case NodeState::kFailed:
      return std::nullopt;
  }
  return std::nullopt;
}

} // namespace netorch::lifecycle
