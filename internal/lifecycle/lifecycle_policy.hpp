#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/node_record.hpp"
#include "internal/model/node_state.hpp"

namespace netorch::lifecycle {

/*
  Deterministic provisioning rules, keyed on the node's store id.

  These mappings are a stable contract: the same (node id, deployment id)
  always provisions in the same time and ends in the same state.

    PENDING       -> PROVISIONING  first time the node is seen
    PROVISIONING  -> CONFIGURING   after 3 + id % 5 seconds
    CONFIGURING   -> RUNNING       after 5 + id % 7 seconds
                  -> FAILED        instead, when (id + deployment) % 20 == 0
*/

std::chrono::seconds ProvisioningDuration(int64_t node_id);
std::chrono::seconds ConfiguringDuration(int64_t node_id);

bool FailsConfiguration(int64_t node_id, int64_t deployment_id);

// 10.0.<deployment>.<id % 255>
std::string AssignIpAddress(int64_t deployment_id, int64_t node_id);

// Transition due at now_ms, if any. Terminal nodes never have one.
std::optional<netorch::model::NodeState> NextState(const db::model::NodeRecord& node, int64_t now_ms);

} // namespace netorch::lifecycle
