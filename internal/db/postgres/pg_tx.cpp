#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace netorch::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    NETORCH_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
