#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "flowstead/history/v1/history.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/history/inbox.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/util/time.hpp"

namespace flowstead::activity {

using WakeFn = std::function<void(const flowstead::core::v1::WorkflowExecutionKey&)>;

/*
  ActivityScheduler

  Owns an activity from its ActivityScheduled event until a terminal
  outcome. Worker reports and timeout sweeps resolve to one of:
    - ActivityCompleted posted to the run's inbox, task deleted
    - retry: same task re-enqueued with attempt + 1 after the backoff delay
    - ActivityFailed / ActivityTimedOut posted, task deleted

  A report names the attempt it ran. Reports for a task that no longer
  exists, for an attempt other than the current one, or for an attempt
  that is not leased (timed out and awaiting retry) throw util::NotFound
  and change nothing.
*/
class ActivityScheduler {
 public:
  ActivityScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::TaskQueue> queue,
                    std::shared_ptr<history::Inbox> inbox, std::shared_ptr<util::Clock> clock,
                    util::Millis default_start_to_close);

  // Called after the wake-worthy transaction commits.
  void SetWakeCallback(WakeFn wake);

  // Inside the decision transaction that records ActivityScheduled.
  // Returns the enqueued task; call queue Notify after commit.
  flowstead::runtime::v1::ActivityTask Schedule(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                                                const flowstead::history::v1::ActivityScheduledAttributes& scheduled);

  void Complete(const std::string& task_id, int32_t attempt, const std::string& result);
  void Fail(const std::string& task_id, int32_t attempt, flowstead::core::v1::Failure failure, bool retryable);

  // Applies start_to_close and schedule_to_start timeouts; returns the
  // number of expired attempts handled.
  std::size_t SweepTimeouts();

  // Drops every outstanding task of a closing run.
  void CancelForRun(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key);

  std::vector<flowstead::runtime::v1::ActivityTask> PendingForRun(db::Transaction& tx,
                                                                  const flowstead::core::v1::WorkflowExecutionKey& key);

 private:
  enum class Resolution { kRetried, kTerminal };

  // The task record for a worker report, or util::NotFound.
  db::model::TaskRecord CurrentAttempt(db::Transaction& tx, const std::string& task_id, int32_t attempt);

  // Retries or records the terminal outcome for a failed attempt.
  Resolution ResolveFailure(db::Transaction& tx, const db::model::TaskRecord& record,
                            flowstead::runtime::v1::ActivityTask task, const flowstead::core::v1::Failure& failure,
                            bool timed_out);

  void Wake(const flowstead::core::v1::WorkflowExecutionKey& key) const;

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<queue::TaskQueue>  queue_;
  std::shared_ptr<history::Inbox>    inbox_;
  std::shared_ptr<util::Clock>       clock_;
  util::Millis                       default_start_to_close_;
  WakeFn                             wake_;
};

} // namespace flowstead::activity
