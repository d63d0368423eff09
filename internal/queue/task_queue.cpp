#include "internal/queue/task_queue.hpp"

#include <algorithm>
#include <stdexcept>

namespace flowstead::queue {

using flowstead::runtime::v1::ActivityTask;

namespace {

// Delayed retries become visible without a Notify; blocked pollers
// recheck at least this often.
constexpr util::Millis kRecheckInterval{100};

std::string Encode(const ActivityTask& task) {
  std::string payload;
  if (!task.SerializeToString(&payload)) {
    throw std::runtime_error("serialize activity task " + task.task_id());
  }
  return payload;
}

uint64_t ScheduleToStartDeadline(const ActivityTask& task, util::TimePoint visible_at) {
  const auto timeout = util::FromProto(task.schedule_to_start());
  if (timeout.count() <= 0) return 0;
  return util::ToUnixMillis(visible_at + timeout);
}

} // namespace

ActivityTask DecodeTask(const db::model::TaskRecord& record) {
  ActivityTask task;
  if (!task.ParseFromString(record.payload)) {
    throw std::runtime_error("corrupt activity task " + record.task_id);
  }
  return task;
}

TaskQueue::TaskQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void TaskQueue::Enqueue(db::Transaction& tx, const ActivityTask& task, util::TimePoint visible_at) {
  db::model::TaskRecord record;
  record.task_id                       = task.task_id();
  record.task_queue                    = task.task_queue();
  record.workflow_id                   = task.execution().workflow_id();
  record.run_id                        = task.execution().run_id();
  record.command_id                    = task.command_id();
  record.attempt                       = task.attempt();
  record.visible_at_ms                 = util::ToUnixMillis(visible_at);
  record.schedule_to_start_deadline_ms = ScheduleToStartDeadline(task, visible_at);
  record.payload                       = Encode(task);

  db::ThrowIfError(repository_->InsertTask(tx, record), "enqueue task " + task.task_id());
}

void TaskQueue::Requeue(db::Transaction& tx, db::model::TaskRecord record, const ActivityTask& task, util::TimePoint visible_at) {
  record.attempt                       = task.attempt();
  record.visible_at_ms                 = util::ToUnixMillis(visible_at);
  record.lease_owner.clear();
  record.lease_expiry_ms               = 0;
  record.schedule_to_start_deadline_ms = ScheduleToStartDeadline(task, visible_at);
  record.payload                       = Encode(task);

  db::ThrowIfError(repository_->UpdateTask(tx, record), "requeue task " + task.task_id());
}

std::optional<ActivityTask> TaskQueue::TryPoll(const std::string& task_queue, const std::string& worker_id) {
  auto       tx  = repository_->Begin();
  const auto now = clock_->Now();

  auto visible = repository_->ListVisibleTasks(*tx, task_queue, util::ToUnixMillis(now), 1);
  if (visible.empty()) {
    tx->Rollback();
    return std::nullopt;
  }

  auto record = std::move(visible.front());
  auto task   = DecodeTask(record);

  const auto lease_expiry = now + util::FromProto(task.start_to_close());
  *task.mutable_lease_expiry() = util::ToProto(lease_expiry);

  record.lease_owner     = worker_id;
  record.lease_expiry_ms = util::ToUnixMillis(lease_expiry);
  record.payload         = Encode(task);

  db::ThrowIfError(repository_->UpdateTask(*tx, record), "lease task " + record.task_id);
  tx->Commit();
  return task;
}

std::optional<ActivityTask> TaskQueue::Poll(const std::string& task_queue, const std::string& worker_id, util::Millis wait) {
  const auto deadline = std::chrono::steady_clock::now() + wait;

  for (;;) {
    uint64_t generation = 0;
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) return std::nullopt;
      generation = WaitersFor(task_queue).generation;
    }

    if (auto task = TryPoll(task_queue, worker_id)) {
      return task;
    }

    std::unique_lock lock(mutex_);
    auto&            waiters = WaitersFor(task_queue);
    const auto       now     = std::chrono::steady_clock::now();
    if (now >= deadline) return std::nullopt;

    const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kRecheckInterval);
    waiters.cv.wait_for(lock, slice, [&] { return shutdown_ || waiters.generation != generation; });
  }
}

void TaskQueue::Notify(const std::string& task_queue) {
  std::lock_guard lock(mutex_);
  auto&           waiters = WaitersFor(task_queue);
  ++waiters.generation;
  waiters.cv.notify_all();
}

void TaskQueue::Shutdown() {
  std::lock_guard lock(mutex_);
  shutdown_ = true;
  for (auto& [name, waiters] : waiters_) {
    waiters->cv.notify_all();
  }
}

TaskQueue::Waiters& TaskQueue::WaitersFor(const std::string& task_queue) {
  auto& slot = waiters_[task_queue];
  if (!slot) slot = std::make_unique<Waiters>();
  return *slot;
}

} // namespace flowstead::queue
