#pragma once

#include <memory>
#include <optional>
#include <string>

#include "flowstead/core/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace flowstead::lease {

enum class AcquireResult { kOk, kAlreadyHeld };
enum class RenewResult { kOk, kLost };

/*
  RunLockManager

  At most one unexpired lock per run. Expiry is the only crash
  detection: a holder that stops renewing loses the run once
  lease_expiry passes, and any other holder may then acquire it.

  Re-acquiring as the current holder extends the lease. The ttl given
  at acquisition is stored and reused by Renew.

  Fence() is the in-transaction check a holder runs right before it
  commits; it renews as a side effect so a decision that commits is
  always covered by a live lease.
*/
class RunLockManager {
 public:
  RunLockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  AcquireResult Acquire(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& holder_id, util::Millis ttl);
  RenewResult   Renew(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& holder_id);

  // No-op unless holder_id holds the lock.
  void Release(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& holder_id);

  bool Fence(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& holder_id);

  // True when no unexpired lock exists for the run.
  bool IsFree(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key);

  std::optional<db::model::RunLockRecord> Inspect(const flowstead::core::v1::WorkflowExecutionKey& key);

 private:
  RenewResult RenewInTransaction(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                                 const std::string& holder_id);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace flowstead::lease
