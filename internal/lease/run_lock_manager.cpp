#include "internal/lease/run_lock_manager.hpp"

#include "internal/util/execution_key.hpp"

namespace flowstead::lease {

RunLockManager::RunLockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

AcquireResult RunLockManager::Acquire(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& holder_id,
                                      util::Millis ttl) {
  auto       tx     = repository_->Begin();
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  auto existing = repository_->GetRunLock(*tx, key.workflow_id(), key.run_id());
  if (existing && existing->holder_id != holder_id && existing->lease_expiry_ms > now_ms) {
    tx->Rollback();
    return AcquireResult::kAlreadyHeld;
  }

  db::model::RunLockRecord record;
  record.workflow_id     = key.workflow_id();
  record.run_id          = key.run_id();
  record.holder_id       = holder_id;
  record.ttl_ms          = static_cast<uint64_t>(ttl.count());
  record.lease_expiry_ms = now_ms + record.ttl_ms;

  db::ThrowIfError(repository_->UpsertRunLock(*tx, record), "acquire run lock " + util::KeyString(key));
  tx->Commit();
  return AcquireResult::kOk;
}

RenewResult RunLockManager::Renew(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& holder_id) {
  auto tx     = repository_->Begin();
  auto result = RenewInTransaction(*tx, key, holder_id);
  if (result == RenewResult::kLost) {
    tx->Rollback();
    return result;
  }
  tx->Commit();
  return result;
}

RenewResult RunLockManager::RenewInTransaction(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                                               const std::string& holder_id) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  auto lock = repository_->GetRunLock(tx, key.workflow_id(), key.run_id());
  if (!lock || lock->holder_id != holder_id || lock->lease_expiry_ms <= now_ms) {
    return RenewResult::kLost;
  }

  lock->lease_expiry_ms = now_ms + lock->ttl_ms;
  db::ThrowIfError(repository_->UpsertRunLock(tx, *lock), "renew run lock " + util::KeyString(key));
  return RenewResult::kOk;
}

void RunLockManager::Release(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& holder_id) {
  auto tx   = repository_->Begin();
  auto lock = repository_->GetRunLock(*tx, key.workflow_id(), key.run_id());
  if (!lock || lock->holder_id != holder_id) {
    tx->Rollback();
    return;
  }

  db::ThrowIfError(repository_->DeleteRunLock(*tx, key.workflow_id(), key.run_id()), "release run lock " + util::KeyString(key));
  tx->Commit();
}

bool RunLockManager::Fence(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                           const std::string& holder_id) {
  return RenewInTransaction(tx, key, holder_id) == RenewResult::kOk;
}

bool RunLockManager::IsFree(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key) {
  auto lock = repository_->GetRunLock(tx, key.workflow_id(), key.run_id());
  return !lock || lock->lease_expiry_ms <= util::ToUnixMillis(clock_->Now());
}

std::optional<db::model::RunLockRecord> RunLockManager::Inspect(const flowstead::core::v1::WorkflowExecutionKey& key) {
  auto tx   = repository_->Begin();
  auto lock = repository_->GetRunLock(*tx, key.workflow_id(), key.run_id());
  tx->Commit();
  return lock;
}

} // namespace flowstead::lease
