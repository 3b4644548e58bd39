#include "pg_pool.hpp"

namespace netorch::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    // dead connection: drop it and open a replacement in its slot
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // deployments
  conn.prepare("insert_deployment",
               "INSERT INTO deployments(name,description,target_node_count,created_at,updated_at) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("get_deployment",
               "SELECT id,name,description,target_node_count,created_at,updated_at FROM deployments WHERE id=$1");
  conn.prepare("list_deployments",
               "SELECT id,name,description,target_node_count,created_at,updated_at FROM deployments "
               "ORDER BY id DESC LIMIT $1 OFFSET $2");
  conn.prepare("count_deployments", "SELECT COUNT(*) FROM deployments");
  conn.prepare("delete_deployment", "DELETE FROM deployments WHERE id=$1");

  // nodes
  conn.prepare("insert_node",
               "INSERT INTO nodes(deployment_id,node_id,hostname,state,ip_address,created_at,updated_at,state_changed_at) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");
  conn.prepare("get_node",
               "SELECT id,deployment_id,node_id,hostname,state,ip_address,created_at,updated_at,state_changed_at "
               "FROM nodes WHERE id=$1");
  conn.prepare("list_nodes_by_deployment",
               "SELECT id,deployment_id,node_id,hostname,state,ip_address,created_at,updated_at,state_changed_at "
               "FROM nodes WHERE deployment_id=$1 ORDER BY id ASC");
  conn.prepare("list_nodes_by_state",
               "SELECT id,deployment_id,node_id,hostname,state,ip_address,created_at,updated_at,state_changed_at "
               "FROM nodes WHERE state = ANY($1::text[]) ORDER BY id ASC");
  conn.prepare("count_nodes", "SELECT COUNT(*) FROM nodes WHERE deployment_id=$1");
  conn.prepare("update_node",
               "UPDATE nodes SET hostname=$2,state=$3,ip_address=$4,updated_at=$5,state_changed_at=$6 WHERE id=$1");

  // telemetry; NULL filters match everything, LIMIT NULL is unbounded
  conn.prepare("insert_sample",
               "INSERT INTO telemetry_samples(node_id,deployment_id,sampled_at,latency_ms,throughput_gbps,error_rate) "
               "VALUES($1,$2,$3,$4,$5,$6) RETURNING id");
  conn.prepare("list_telemetry",
               "SELECT id,node_id,deployment_id,sampled_at,latency_ms,throughput_gbps,error_rate "
               "FROM telemetry_samples WHERE deployment_id=$1 "
               "AND ($2::bigint IS NULL OR node_id=$2) "
               "AND ($3::bigint IS NULL OR sampled_at>=$3) "
               "AND ($4::bigint IS NULL OR sampled_at<=$4) "
               "ORDER BY sampled_at DESC, id DESC LIMIT $5");

  // events
  conn.prepare("insert_event",
               "INSERT INTO events(deployment_id,node_id,event_type,message,metadata,created_at) "
               "VALUES($1,$2,$3,$4,$5,$6) RETURNING id");
  conn.prepare("list_events",
               "SELECT id,deployment_id,node_id,event_type,message,metadata,created_at FROM events "
               "WHERE ($1::bigint IS NULL OR deployment_id=$1) AND ($2::bigint IS NULL OR node_id=$2) "
               "ORDER BY id ASC LIMIT $3");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace netorch::db::postgres
