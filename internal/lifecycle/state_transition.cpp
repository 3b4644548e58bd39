#include "state_transition.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/db/api/result_check.hpp"
#include "internal/util/errors.hpp"

namespace netorch::lifecycle {

using netorch::model::NodeState;
using netorch::model::ToString;

std::string TransitionMetadata(const std::string& node_id, NodeState from, NodeState to) {
  google::protobuf::Struct metadata;
  auto&                    fields = *metadata.mutable_fields();
  fields["node_id"].set_string_value(node_id);
  fields["old_state"].set_string_value(std::string(ToString(from)));
  fields["new_state"].set_string_value(std::string(ToString(to)));

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &json);
  if (!status.ok()) {
    throw std::runtime_error("serialize transition metadata: " + std::string(status.message()));
  }
  return json;
}

std::string TransitionMessage(const std::string& node_id, NodeState from, NodeState to) {
  switch (to) {
    case NodeState::kProvisioning:
      return "Starting hardware provisioning for " + node_id;
    case NodeState::kConfiguring:
      return "Hardware provisioned, starting configuration for " + node_id;
    case NodeState::kFailed:
      return "Configuration failed for " + node_id;
    case NodeState::kRunning:
      return "Node " + node_id + " is now running";
    default:
      return "Node " + node_id + " transitioned from " + std::string(ToString(from)) + " to " + std::string(ToString(to));
  }
}

void ApplyTransition(db::Repository& repository, db::Transaction& tx, db::model::NodeRecord& node, NodeState to, int64_t now_ms) {
  const NodeState from = node.state;
  if (!netorch::model::CanTransition(from, to)) {
    throw netorch::util::InvalidState("node " + node.node_id + ": illegal transition " + std::string(ToString(from)) + " -> " +
                                      std::string(ToString(to)));
  }

  auto updated                = node;
  updated.state               = to;
  updated.state_changed_at_ms = now_ms;
  updated.updated_at_ms       = now_ms;
  db::ThrowIfError(repository.UpdateNode(tx, updated), "update node " + node.node_id);

  db::model::EventRecord event;
  event.deployment_id = node.deployment_id;
  event.node_id       = node.id;
  event.event_type    = db::model::kEventStateChange;
  event.message       = TransitionMessage(node.node_id, from, to);
  event.metadata      = TransitionMetadata(node.node_id, from, to);
  event.created_at_ms = now_ms;
  db::ThrowIfError(repository.InsertEvent(tx, event), "record transition event for " + node.node_id);

  node = std::move(updated);
}

} // namespace netorch::lifecycle
