#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    PIPELINE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::Conflict(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::Conflict(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::failure& e) {
    throw std::runtime_error(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace pipeline::db::postgres
