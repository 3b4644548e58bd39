#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"

namespace netorch::lifecycle {

/*
  Moves `node` to `to` inside `tx` and appends the matching STATE_CHANGE
  event. Nothing is committed here; the caller owns the transaction.

  Throws util::InvalidState for an edge the state machine does not allow.
  On success `node` reflects the persisted row.
*/
void ApplyTransition(db::Repository& repository, db::Transaction& tx, db::model::NodeRecord& node, netorch::model::NodeState to,
                     int64_t now_ms);

// Audit message for one lifecycle stage.
std::string TransitionMessage(const std::string& node_id, netorch::model::NodeState from, netorch::model::NodeState to);

// {"node_id": ..., "old_state": ..., "new_state": ...}
std::string TransitionMetadata(const std::string& node_id, netorch::model::NodeState from, netorch::model::NodeState to);

} // namespace netorch::lifecycle
