#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace streamgate::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      STREAMGATE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // work must be gone before the connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  tx_->abort();
  finished_ = true;
}

} // namespace streamgate::db::postgres
