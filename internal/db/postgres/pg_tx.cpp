#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace songqueue::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  try {
    conn_ = pool->Acquire();
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::failure& e) {
    throw DatabaseError(ErrorCode::IOError, e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    SONGQUEUE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw DatabaseError(ErrorCode::SerializationFailure, e.what());
  } catch (const pqxx::failure& e) {
    finished_ = true;
    throw DatabaseError(ErrorCode::IOError, e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
