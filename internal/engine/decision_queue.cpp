#include "internal/engine/decision_queue.hpp"

#include <algorithm>

#include "internal/util/execution_key.hpp"

namespace flowstead::engine {

using flowstead::core::v1::WorkflowExecutionKey;

namespace {

// Delayed entries are rechecked at least this often; the clock may be
// a manual one that never signals.
constexpr util::Millis kRecheckInterval{50};

} // namespace

DecisionQueue::DecisionQueue(std::shared_ptr<util::Clock> clock) : clock_(std::move(clock)) {
}

void DecisionQueue::Push(const WorkflowExecutionKey& key, util::TimePoint not_before) {
  const auto id = util::KeyString(key);
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;

    auto& target = in_flight_.count(id) > 0 ? dirty_ : queued_;
    auto  it     = target.find(id);
    if (it == target.end()) {
      target.emplace(id, Entry{key, not_before});
    } else {
      it->second.not_before = std::min(it->second.not_before, not_before);
    }
  }
  cv_.notify_one();
}

std::optional<WorkflowExecutionKey> DecisionQueue::TakeDue() {
  const auto now  = clock_->Now();
  auto       best = queued_.end();
  for (auto it = queued_.begin(); it != queued_.end(); ++it) {
    if (it->second.not_before > now) continue;
    if (best == queued_.end() || it->second.not_before < best->second.not_before) best = it;
  }
  if (best == queued_.end()) return std::nullopt;

  auto key = best->second.key;
  in_flight_.insert(best->first);
  queued_.erase(best);
  return key;
}

std::optional<WorkflowExecutionKey> DecisionQueue::Pop() {
  std::unique_lock lock(mutex_);
  for (;;) {
    if (shutdown_) return std::nullopt;
    if (auto key = TakeDue()) return key;
    cv_.wait_for(lock, kRecheckInterval);
  }
}

std::optional<WorkflowExecutionKey> DecisionQueue::TryPop() {
  std::lock_guard lock(mutex_);
  if (shutdown_) return std::nullopt;
  return TakeDue();
}

void DecisionQueue::Done(const WorkflowExecutionKey& key) {
  const auto id = util::KeyString(key);
  {
    std::lock_guard lock(mutex_);
    in_flight_.erase(id);

    auto it = dirty_.find(id);
    if (it == dirty_.end()) return;

    auto existing = queued_.find(id);
    if (existing == queued_.end()) {
      queued_.emplace(id, it->second);
    } else {
      existing->second.not_before = std::min(existing->second.not_before, it->second.not_before);
    }
    dirty_.erase(it);
  }
  cv_.notify_one();
}

void DecisionQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t DecisionQueue::QueuedCount() const {
  std::lock_guard lock(mutex_);
  return queued_.size();
}

} // namespace flowstead::engine
