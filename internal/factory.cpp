#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if NETORCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if NETORCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace netorch::factory {

using netorch::observability::BoolField;
using netorch::observability::IntField;
using netorch::observability::StringField;

namespace {

#if NETORCH_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS deployments (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', "
      "target_node_count INTEGER NOT NULL, created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS nodes (id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "deployment_id INTEGER NOT NULL REFERENCES deployments(id) ON DELETE CASCADE, node_id TEXT NOT NULL, hostname TEXT NOT NULL, "
      "state TEXT NOT NULL, ip_address TEXT, created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL, state_changed_at INTEGER NOT NULL, "
      "UNIQUE(deployment_id, node_id));",
      "CREATE TABLE IF NOT EXISTS telemetry_samples (id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "node_id INTEGER NOT NULL REFERENCES nodes(id) ON DELETE CASCADE, "
      "deployment_id INTEGER NOT NULL REFERENCES deployments(id) ON DELETE CASCADE, sampled_at INTEGER NOT NULL, "
      "latency_ms REAL NOT NULL, throughput_gbps REAL NOT NULL, error_rate REAL NOT NULL);",
      "CREATE TABLE IF NOT EXISTS events (id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "deployment_id INTEGER REFERENCES deployments(id) ON DELETE CASCADE, node_id INTEGER REFERENCES nodes(id) ON DELETE CASCADE, "
      "event_type TEXT NOT NULL, message TEXT NOT NULL, metadata TEXT NOT NULL DEFAULT '', created_at INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_nodes_state ON nodes(state);",
      "CREATE INDEX IF NOT EXISTS idx_telemetry_deployment_time ON telemetry_samples(deployment_id, sampled_at);",
      "CREATE INDEX IF NOT EXISTS idx_telemetry_node_time ON telemetry_samples(node_id, sampled_at);",
      "CREATE INDEX IF NOT EXISTS idx_events_deployment ON events(deployment_id);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if NETORCH_DB_POSTGRES
// Runs on a dedicated connection: pooled connections prepare statements
// against these tables as soon as they open.
void BootstrapPostgresSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  tx.exec("CREATE TABLE IF NOT EXISTS deployments (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', "
          "target_node_count INTEGER NOT NULL, created_at BIGINT NOT NULL, updated_at BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS nodes (id BIGSERIAL PRIMARY KEY, "
          "deployment_id BIGINT NOT NULL REFERENCES deployments(id) ON DELETE CASCADE, node_id TEXT NOT NULL, hostname TEXT NOT NULL, "
          "state TEXT NOT NULL, ip_address TEXT, created_at BIGINT NOT NULL, updated_at BIGINT NOT NULL, state_changed_at BIGINT NOT NULL, "
          "UNIQUE(deployment_id, node_id));");
  tx.exec("CREATE TABLE IF NOT EXISTS telemetry_samples (id BIGSERIAL PRIMARY KEY, "
          "node_id BIGINT NOT NULL REFERENCES nodes(id) ON DELETE CASCADE, "
          "deployment_id BIGINT NOT NULL REFERENCES deployments(id) ON DELETE CASCADE, sampled_at BIGINT NOT NULL, "
          "latency_ms DOUBLE PRECISION NOT NULL, throughput_gbps DOUBLE PRECISION NOT NULL, error_rate DOUBLE PRECISION NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS events (id BIGSERIAL PRIMARY KEY, "
          "deployment_id BIGINT REFERENCES deployments(id) ON DELETE CASCADE, node_id BIGINT REFERENCES nodes(id) ON DELETE CASCADE, "
          "event_type TEXT NOT NULL, message TEXT NOT NULL, metadata TEXT NOT NULL DEFAULT '', created_at BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_nodes_state ON nodes(state);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_telemetry_deployment_time ON telemetry_samples(deployment_id, sampled_at);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_telemetry_node_time ON telemetry_samples(node_id, sampled_at);");
  tx.exec("CREATE INDEX IF NOT EXISTS idx_events_deployment ON events(deployment_id);");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const netorch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if NETORCH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    NETORCH_LOG_INFO("Using sqlite store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if NETORCH_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    NETORCH_LOG_INFO("Using postgres store", {IntField("max_connections", database.postgres().max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  NETORCH_LOG_WARN("No database configured, using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const netorch::runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);
  app.detector   = std::make_shared<analytics::BottleneckDetector>(app.repository);

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  const auto& workers = config.workers();
  if (!workers.lifecycle().disabled()) {
    app.lifecycle = std::make_shared<lifecycle::LifecycleScheduler>(app.repository,
                                                                    std::chrono::milliseconds(workers.lifecycle().poll_interval_ms()),
                                                                    std::chrono::milliseconds(workers.lifecycle().error_backoff_ms()));
  }
  if (!workers.telemetry().disabled()) {
    app.telemetry = std::make_shared<telemetry::TelemetryGenerator>(app.repository,
                                                                    std::chrono::milliseconds(workers.telemetry().collection_interval_ms()),
                                                                    std::chrono::milliseconds(workers.telemetry().error_backoff_ms()));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository                  = app.repository;
  ctx.detector                    = app.detector;
  ctx.lifecycle                   = app.lifecycle;
  ctx.telemetry                   = app.telemetry;
  ctx.default_window_minutes      = config.analytics().default_window_minutes();
  ctx.default_deviation_threshold = config.analytics().default_deviation_threshold();

  app.orchestrator = std::make_shared<service::OrchestratorService>(std::move(ctx));
  return app;
}

void Application::StartWorkers() {
  if (lifecycle) lifecycle->Start();
  if (telemetry) telemetry->Start();
  NETORCH_LOG_INFO("Workers started", {BoolField("lifecycle", lifecycle != nullptr), BoolField("telemetry", telemetry != nullptr)});
}

void Application::StopWorkers() {
  if (lifecycle) lifecycle->Stop();
  if (telemetry) telemetry->Stop();
}

} // namespace netorch::factory
