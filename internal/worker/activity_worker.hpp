#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "flowstead/runtime/v1/task.pb.h"
#include "internal/activity/activity_registry.hpp"
#include "internal/util/time.hpp"
#include "task_poller.hpp"

namespace flowstead::worker {

struct WorkerOptions {
  std::string  worker_id; // empty: assigned on registration
  std::string  task_queue = "default";
  int          threads    = 2;
  util::Millis poll_wait{1000};
  util::Millis error_backoff{500};
};

/*
  ActivityWorker

  Polls one task queue and runs activities from the registry. Each
  result is reported exactly once per delivered attempt:

      return value                  -> Complete
      util::NonRetryableActivityError -> Fail, not retryable
      util::TransientActivityError  -> Fail, retryable, with its type
      any other std::exception      -> Fail, retryable
*/
class ActivityWorker {
 public:
  ActivityWorker(WorkerOptions options, std::shared_ptr<const activity::ActivityRegistry> registry,
                 std::shared_ptr<TaskPoller> poller);
  ~ActivityWorker();

  ActivityWorker(const ActivityWorker&)            = delete;
  ActivityWorker& operator=(const ActivityWorker&) = delete;

  // Registers with the engine, then starts the polling threads.
  void Start();
  void Stop();

  // Runs every task that is deliverable right now on the calling thread.
  // Registers first if needed. Returns the number of tasks executed.
  std::size_t ProcessAvailable();

  const std::string& worker_id() const {
    return worker_id_;
  }

 private:
  void EnsureRegistered();
  void Run();
  void Execute(const flowstead::runtime::v1::ActivityTask& task);

  WorkerOptions                                     options_;
  std::shared_ptr<const activity::ActivityRegistry> registry_;
  std::shared_ptr<TaskPoller>                       poller_;
  std::string                                       worker_id_;

  std::atomic<bool>        running_{false};
  std::vector<std::thread> threads_;
};

} // namespace flowstead::worker
