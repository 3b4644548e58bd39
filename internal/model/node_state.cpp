#include "node_state.hpp"

namespace netorch::model {

std::string_view ToString(NodeState state) {
  switch (state) {
    case NodeState::kPending:
      return "PENDING";
    case NodeState::kProvisioning:
      return "PROVISIONING";
    case NodeState::kConfiguring:
      return "CONFIGURING";
    case NodeState::kRunning:
      return "RUNNING";
    case NodeState::kFailed:
      return "FAILED";
  }
  return "PENDING";
}

std::optional<NodeState> ParseNodeState(std::string_view name) {
  for (auto state : {NodeState::kPending, NodeState::kProvisioning, NodeState::kConfiguring, NodeState::kRunning, NodeState::kFailed}) {
    if (ToString(state) == name) {
      return state;
    }
  }
  return std::nullopt;
}

netorch::v1::NodeState ToProto(NodeState state) {
  switch (state) {
    case NodeState::kPending:
      return netorch::v1::NODE_STATE_PENDING;
    case NodeState::kProvisioning:
      return netorch::v1::NODE_STATE_PROVISIONING;
    case NodeState::kConfiguring:
      return netorch::v1::NODE_STATE_CONFIGURING;
    case NodeState::kRunning:
      return netorch::v1::NODE_STATE_RUNNING;
    case NodeState::kFailed:
      return netorch::v1::NODE_STATE_FAILED;
  }
  return netorch::v1::NODE_STATE_UNSPECIFIED;
}

} // namespace netorch::model
