#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace netorch::db::model {

inline constexpr const char* kEventDeploymentCreated = "DEPLOYMENT_CREATED";
inline constexpr const char* kEventStateChange       = "STATE_CHANGE";

/*
  Audit log row. Append-only.
*/
struct EventRecord {
  int64_t                id = 0;
  std::optional<int64_t> deployment_id;
  std::optional<int64_t> node_id;
  std::string            event_type;
  std::string            message;
  std::string            metadata; // JSON object text, may be empty
  int64_t                created_at_ms = 0;
};

}
