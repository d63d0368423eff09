#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "flowstead/runtime/v1/task.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace flowstead::queue {

/*
  TaskQueue

  At-least-once delivery of activity tasks. Tasks live in the
  repository; polling leases a task until now + start_to_close instead
  of consuming it. A lease that runs out without an ack is handled by
  the ActivityScheduler's timeout sweep, which redelivers or fails it.

  Pollers block on a condition variable per queue name. Writers call
  Notify() after their transaction commits.
*/
class TaskQueue {
 public:
  TaskQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  // Inside the caller's transaction; the task becomes deliverable at visible_at.
  void Enqueue(db::Transaction& tx, const flowstead::runtime::v1::ActivityTask& task, util::TimePoint visible_at);

  // Puts an existing task back to pending for another attempt.
  void Requeue(db::Transaction& tx, db::model::TaskRecord record, const flowstead::runtime::v1::ActivityTask& task,
               util::TimePoint visible_at);

  // Blocks up to wait for a deliverable task. Returns the leased task.
  std::optional<flowstead::runtime::v1::ActivityTask> Poll(const std::string& task_queue, const std::string& worker_id,
                                                           util::Millis wait);

  std::optional<flowstead::runtime::v1::ActivityTask> TryPoll(const std::string& task_queue, const std::string& worker_id);

  void Notify(const std::string& task_queue);

  // Wakes every blocked poller; later polls return immediately.
  void Shutdown();

 private:
  struct Waiters {
    std::condition_variable cv;
    uint64_t                generation = 0;
  };

  Waiters& WaitersFor(const std::string& task_queue);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;

  std::mutex                                                 mutex_;
  std::unordered_map<std::string, std::unique_ptr<Waiters>> waiters_;
  bool                                                       shutdown_ = false;
};

// Decodes the ActivityTask stored in a task record.
flowstead::runtime::v1::ActivityTask DecodeTask(const db::model::TaskRecord& record);

} // namespace flowstead::queue
