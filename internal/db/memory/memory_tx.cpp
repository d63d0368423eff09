#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace flowstead::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != snapshot_version_) {
      throw util::TransactionConflict("transaction conflict: state was modified by a concurrent transaction");
    }
    repo_.committed_ = std::move(working_);
    repo_.committed_version_++;
    committed_ = true;
  }
  writer_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_.owns_lock()) writer_.unlock();
}

} // namespace flowstead::db::memory
