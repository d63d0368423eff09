#include "sqlite_tx.hpp"

#include <sqlite3.h>

namespace flowstead::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    // best effort: a failed ROLLBACK leaves nothing to undo
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace flowstead::db::sqlite
