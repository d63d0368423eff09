#include "pg_tx.hpp"

namespace flowstead::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  // pqxx::work aborts in its own destructor when neither committed nor aborted
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
}

}
