#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "netorch/v1/types.pb.h"

namespace netorch::model {

/*
  Node lifecycle state machine.

    PENDING -> PROVISIONING -> CONFIGURING -> RUNNING
                                           -> FAILED

  RUNNING and FAILED are terminal.
*/
enum class NodeState : std::uint8_t {
  kPending      = 1,
  kProvisioning = 2,
  kConfiguring  = 3,
  kRunning      = 4,
  kFailed       = 5,
};

constexpr bool IsTerminal(NodeState state) {
  return state == NodeState::kRunning || state == NodeState::kFailed;
}

constexpr bool CanTransition(NodeState from, NodeState to) {
  switch (from) {
    case NodeState::kPending:
      return to == NodeState::kProvisioning;
    case NodeState::kProvisioning:
      return to == NodeState::kConfiguring;
    case NodeState::kConfiguring:
      return to == NodeState::kRunning || to == NodeState::kFailed;
    case NodeState::kRunning:
    case NodeState::kFailed:
      return false;
  }
  return false;
}

// Canonical upper-case name, also the persisted form.
std::string_view ToString(NodeState state);

std::optional<NodeState> ParseNodeState(std::string_view name);

netorch::v1::NodeState ToProto(NodeState state);

} // namespace netorch::model
