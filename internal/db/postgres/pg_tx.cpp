#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace flightline::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      FLIGHTLINE_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
  // work must end before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) {
    return;
  }
  tx_->abort();
  finished_ = true;
}

} // namespace flightline::db::postgres
