#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/node_state.hpp"

namespace netorch::db::model {

/*
  Persistent node row.

  IMPORTANT:
  - state_changed_at_ms moves on, and only on, a state transition.
  - ip_address is assigned once, at the first transition.
*/
struct NodeRecord {
  int64_t     id            = 0; // assigned by the repository on insert
  int64_t     deployment_id = 0;
  std::string node_id;           // unique within the deployment, e.g. node-001
  std::string hostname;

  netorch::model::NodeState state = netorch::model::NodeState::kPending;

  std::optional<std::string> ip_address;

  int64_t created_at_ms       = 0;
  int64_t updated_at_ms       = 0;
  int64_t state_changed_at_ms = 0;
};

}
