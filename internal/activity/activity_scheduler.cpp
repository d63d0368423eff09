#include "internal/activity/activity_scheduler.hpp"

#include <set>

#include "internal/activity/retry_policy.hpp"
#include "internal/history/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/execution_key.hpp"
#include "internal/util/uuid.hpp"

namespace flowstead::activity {

using namespace flowstead::history::v1;
using flowstead::core::v1::Failure;
using flowstead::core::v1::WorkflowExecutionKey;
using flowstead::runtime::v1::ActivityTask;

namespace {

WorkflowExecutionKey KeyOf(const db::model::TaskRecord& record) {
  return util::MakeKey(record.workflow_id, record.run_id);
}

Failure TimeoutFailure(const ActivityTask& task, bool start_to_close) {
  Failure failure;
  failure.set_kind(flowstead::core::v1::FAILURE_KIND_TIMEOUT);
  if (start_to_close) {
    failure.set_type("StartToCloseTimeout");
    failure.set_message("activity " + task.activity_type() + " attempt " + std::to_string(task.attempt()) +
                        " exceeded its start_to_close timeout");
  } else {
    failure.set_type("ScheduleToStartTimeout");
    failure.set_message("activity " + task.activity_type() + " attempt " + std::to_string(task.attempt()) +
                        " was not picked up before its schedule_to_start timeout");
  }
  return failure;
}

} // namespace

ActivityScheduler::ActivityScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::TaskQueue> queue,
                                     std::shared_ptr<history::Inbox> inbox, std::shared_ptr<util::Clock> clock,
                                     util::Millis default_start_to_close)
    : repository_(std::move(repository)),
      queue_(std::move(queue)),
      inbox_(std::move(inbox)),
      clock_(std::move(clock)),
      default_start_to_close_(default_start_to_close) {
}

void ActivityScheduler::SetWakeCallback(WakeFn wake) {
  wake_ = std::move(wake);
}

ActivityTask ActivityScheduler::Schedule(db::Transaction& tx, const WorkflowExecutionKey& key,
                                         const ActivityScheduledAttributes& scheduled) {
  const auto now = clock_->Now();

  ActivityTask task;
  task.set_task_id(util::NewId());
  task.set_activity_id(scheduled.activity_id());
  *task.mutable_execution() = key;
  task.set_command_id(scheduled.command_id());
  task.set_activity_type(scheduled.activity_type());
  task.set_task_queue(scheduled.task_queue());
  task.set_input(scheduled.input());
  *task.mutable_retry_policy()  = WithDefaults(scheduled.retry_policy());
  task.set_attempt(1);
  *task.mutable_schedule_time() = util::ToProto(now);

  const auto start_to_close = util::FromProto(scheduled.start_to_close());
  *task.mutable_start_to_close() = util::ToProto(start_to_close.count() > 0 ? start_to_close : default_start_to_close_);
  if (scheduled.has_schedule_to_start()) {
    *task.mutable_schedule_to_start() = scheduled.schedule_to_start();
  }

  queue_->Enqueue(tx, task, now);
  return task;
}

db::model::TaskRecord ActivityScheduler::CurrentAttempt(db::Transaction& tx, const std::string& task_id, int32_t attempt) {
  auto record = repository_->GetTask(tx, task_id);
  if (!record) {
    throw util::NotFound("activity task not found: " + task_id);
  }
  if (record->attempt != attempt || record->lease_expiry_ms == 0) {
    throw util::NotFound("activity task " + task_id + " attempt " + std::to_string(attempt) +
                         " is no longer current (current attempt " + std::to_string(record->attempt) +
                         (record->lease_expiry_ms == 0 ? ", not leased)" : ")"));
  }
  return std::move(*record);
}

void ActivityScheduler::Complete(const std::string& task_id, int32_t attempt, const std::string& result) {
  auto       tx     = repository_->Begin();
  const auto record = CurrentAttempt(*tx, task_id, attempt);

  const auto task = queue::DecodeTask(record);
  const auto key  = KeyOf(record);

  auto  event     = history::MakeEvent(EVENT_TYPE_ACTIVITY_COMPLETED, clock_->Now());
  auto* completed = event.mutable_activity_completed();
  completed->set_command_id(task.command_id());
  completed->set_result(result);
  completed->set_attempt(task.attempt());

  inbox_->Post(*tx, key, event);
  db::ThrowIfError(repository_->DeleteTask(*tx, task_id), "delete completed task " + task_id);
  tx->Commit();

  observability::Metrics::Instance().RecordActivityAttempt(task.activity_type(), "completed");
  Wake(key);
}

void ActivityScheduler::Fail(const std::string& task_id, int32_t attempt, Failure failure, bool retryable) {
  auto       tx     = repository_->Begin();
  const auto record = CurrentAttempt(*tx, task_id, attempt);

  if (!retryable) failure.set_non_retryable(true);
  if (failure.kind() == flowstead::core::v1::FAILURE_KIND_UNSPECIFIED) {
    failure.set_kind(flowstead::core::v1::FAILURE_KIND_APPLICATION);
  }

  auto task       = queue::DecodeTask(record);
  auto resolution = ResolveFailure(*tx, record, task, failure, false);
  tx->Commit();

  if (resolution == Resolution::kRetried) {
    queue_->Notify(task.task_queue());
  } else {
    Wake(KeyOf(record));
  }
}

std::size_t ActivityScheduler::SweepTimeouts() {
  auto       tx      = repository_->Begin();
  const auto now_ms  = util::ToUnixMillis(clock_->Now());
  auto       expired = repository_->ListExpiredTasks(*tx, now_ms);
  if (expired.empty()) {
    tx->Rollback();
    return 0;
  }

  std::vector<WorkflowExecutionKey> woken;
  std::set<std::string>             requeued_queues;
  for (const auto& record : expired) {
    auto       task           = queue::DecodeTask(record);
    const bool start_to_close = record.lease_expiry_ms != 0;

    FLOWSTEAD_LOG_WARN("Activity attempt timed out", {observability::StringField("task_id", record.task_id),
                                                      observability::StringField("activity_type", task.activity_type()),
                                                      observability::IntField("attempt", task.attempt()),
                                                      observability::BoolField("start_to_close", start_to_close)});

    if (ResolveFailure(*tx, record, task, TimeoutFailure(task, start_to_close), true) == Resolution::kRetried) {
      requeued_queues.insert(task.task_queue());
    } else {
      woken.push_back(KeyOf(record));
    }
  }
  tx->Commit();

  for (const auto& name : requeued_queues) {
    queue_->Notify(name);
  }
  for (const auto& key : woken) {
    Wake(key);
  }
  return expired.size();
}

ActivityScheduler::Resolution ActivityScheduler::ResolveFailure(db::Transaction& tx, const db::model::TaskRecord& record,
                                                                ActivityTask task, const Failure& failure, bool timed_out) {
  const auto& policy = task.retry_policy();
  const auto  key    = KeyOf(record);

  if (ShouldRetry(policy, task.attempt(), failure)) {
    const auto delay = BackoffDelay(policy, task.attempt());
    task.set_attempt(task.attempt() + 1);
    task.clear_lease_expiry();
    queue_->Requeue(tx, record, task, clock_->Now() + delay);

    observability::Metrics::Instance().RecordActivityAttempt(task.activity_type(), "retried");
    FLOWSTEAD_LOG_INFO("Activity attempt failed; retrying",
                       {observability::StringField("execution", util::KeyString(key)),
                        observability::StringField("activity_type", task.activity_type()),
                        observability::IntField("next_attempt", task.attempt()), observability::IntField("delay_ms", delay.count()),
                        observability::StringField("error", failure.message())});
    return Resolution::kRetried;
  }

  HistoryEvent event;
  if (timed_out) {
    event       = history::MakeEvent(EVENT_TYPE_ACTIVITY_TIMED_OUT, clock_->Now());
    auto* attrs = event.mutable_activity_timed_out();
    attrs->set_command_id(task.command_id());
    *attrs->mutable_failure() = failure;
    attrs->set_attempt(task.attempt());
  } else {
    event       = history::MakeEvent(EVENT_TYPE_ACTIVITY_FAILED, clock_->Now());
    auto* attrs = event.mutable_activity_failed();
    attrs->set_command_id(task.command_id());
    *attrs->mutable_failure() = failure;
    attrs->set_attempt(task.attempt());
  }

  inbox_->Post(tx, key, event);
  db::ThrowIfError(repository_->DeleteTask(tx, record.task_id), "delete failed task " + record.task_id);

  observability::Metrics::Instance().RecordActivityAttempt(task.activity_type(), timed_out ? "timed_out" : "failed");
  return Resolution::kTerminal;
}

void ActivityScheduler::CancelForRun(db::Transaction& tx, const WorkflowExecutionKey& key) {
  for (const auto& record : repository_->ListTasksForRun(tx, key.workflow_id(), key.run_id())) {
    db::ThrowIfError(repository_->DeleteTask(tx, record.task_id), "cancel task " + record.task_id);
  }
}

std::vector<ActivityTask> ActivityScheduler::PendingForRun(db::Transaction& tx, const WorkflowExecutionKey& key) {
  std::vector<ActivityTask> tasks;
  for (const auto& record : repository_->ListTasksForRun(tx, key.workflow_id(), key.run_id())) {
    tasks.push_back(queue::DecodeTask(record));
  }
  return tasks;
}

void ActivityScheduler::Wake(const WorkflowExecutionKey& key) const {
  if (wake_) wake_(key);
}

} // namespace flowstead::activity
