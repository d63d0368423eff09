#pragma once

#include <cstdint>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace flowstead::db::memory {

/*
  Transaction = snapshot + write set

  The writer lock is taken on construction and released on
  Commit/Rollback, so transactions are serialized like BEGIN IMMEDIATE.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_;
  MemoryRepository::State      working_;
  uint64_t                     snapshot_version_ = 0;
  bool                         committed_        = false;
  bool                         rolled_back_      = false;
};

} // namespace flowstead::db::memory
