#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace netorch::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

/*
  Telemetry scan. Results are ordered by timestamp, newest first.
  Time bounds are inclusive.
*/
struct TelemetryQuery {
  int64_t                    deployment_id = 0;
  std::optional<int64_t>     node_id;
  std::optional<int64_t>     start_ms;
  std::optional<int64_t>     end_ms;
  std::optional<std::size_t> limit;
};

// Results are ordered by id (insertion order).
struct EventQuery {
  std::optional<int64_t>     deployment_id;
  std::optional<int64_t>     node_id;
  std::optional<std::size_t> limit;
};

} // namespace netorch::db
