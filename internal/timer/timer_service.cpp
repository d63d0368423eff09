#include "internal/timer/timer_service.hpp"

#include <vector>

#include "internal/util/execution_key.hpp"

namespace flowstead::timer {

using namespace flowstead::history::v1;
using flowstead::core::v1::WorkflowExecutionKey;

TimerService::TimerService(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::Inbox> inbox,
                           std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), inbox_(std::move(inbox)), clock_(std::move(clock)) {
}

void TimerService::SetWakeCallback(WakeFn wake) {
  wake_ = std::move(wake);
}

void TimerService::Schedule(db::Transaction& tx, const WorkflowExecutionKey& key, const TimerStartedAttributes& started) {
  db::model::TimerRecord record;
  record.workflow_id = key.workflow_id();
  record.run_id      = key.run_id();
  record.command_id  = started.command_id();
  record.timer_id    = started.timer_id();
  record.fire_at_ms  = util::ToUnixMillis(util::FromProto(started.fire_at()));

  db::ThrowIfError(repository_->InsertTimer(tx, record), "schedule timer " + util::KeyString(key));
}

void TimerService::CancelForRun(db::Transaction& tx, const WorkflowExecutionKey& key) {
  for (const auto& record : repository_->ListTimersForRun(tx, key.workflow_id(), key.run_id())) {
    db::ThrowIfError(repository_->DeleteTimer(tx, record.workflow_id, record.run_id, record.command_id), "cancel timer");
  }
}

std::size_t TimerService::FireDue() {
  auto       tx  = repository_->Begin();
  const auto now = clock_->Now();
  auto       due = repository_->ListDueTimers(*tx, util::ToUnixMillis(now));
  if (due.empty()) {
    tx->Rollback();
    return 0;
  }

  std::vector<WorkflowExecutionKey> woken;
  for (const auto& record : due) {
    const auto key = util::MakeKey(record.workflow_id, record.run_id);

    auto  event = history::MakeEvent(EVENT_TYPE_TIMER_FIRED, now);
    auto* fired = event.mutable_timer_fired();
    fired->set_command_id(record.command_id);
    fired->set_timer_id(record.timer_id);

    inbox_->Post(*tx, key, event);
    db::ThrowIfError(repository_->DeleteTimer(*tx, record.workflow_id, record.run_id, record.command_id), "fire timer");
    woken.push_back(key);
  }
  tx->Commit();

  if (wake_) {
    for (const auto& key : woken) wake_(key);
  }
  return due.size();
}

} // namespace flowstead::timer
