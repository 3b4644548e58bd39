#pragma once

#include <cstdint>
#include <string>

namespace netorch::db::model {

/*
  Persistent deployment row.

  Owns its nodes, their telemetry and its events (cascade delete).
*/
struct DeploymentRecord {
  int64_t     id = 0; // assigned by the repository on insert
  std::string name;
  std::string description;
  uint32_t    target_node_count = 0;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

}
