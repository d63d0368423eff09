#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "flowstead/runtime/v1/task.pb.h"
#include "internal/util/time.hpp"

namespace flowstead::service {
class TaskService;
}

namespace flowstead::worker {

/*
  The worker side of the task protocol. LocalTaskPoller talks to an
  in-process TaskService; the client library provides a gRPC one.
*/
class TaskPoller {
 public:
  virtual ~TaskPoller() = default;

  // Returns the worker id assigned by the engine.
  virtual std::string Register(const std::string& worker_id, const std::string& task_queue,
                               const std::vector<std::string>& activity_types) = 0;

  // wait == 0 returns immediately.
  virtual std::optional<flowstead::runtime::v1::ActivityTask> Poll(const std::string& worker_id, const std::string& task_queue,
                                                                   util::Millis wait) = 0;

  // Reports the outcome of the attempt `task` was leased for.
  virtual void Complete(const flowstead::runtime::v1::ActivityTask& task, const std::string& result) = 0;

  virtual void Fail(const flowstead::runtime::v1::ActivityTask& task, const flowstead::core::v1::Failure& failure,
                    bool retryable) = 0;
};

class LocalTaskPoller final : public TaskPoller {
 public:
  explicit LocalTaskPoller(std::shared_ptr<service::TaskService> service);

  std::string Register(const std::string& worker_id, const std::string& task_queue,
                       const std::vector<std::string>& activity_types) override;

  std::optional<flowstead::runtime::v1::ActivityTask> Poll(const std::string& worker_id, const std::string& task_queue,
                                                           util::Millis wait) override;

  void Complete(const flowstead::runtime::v1::ActivityTask& task, const std::string& result) override;

  void Fail(const flowstead::runtime::v1::ActivityTask& task, const flowstead::core::v1::Failure& failure,
            bool retryable) override;

 private:
  std::shared_ptr<service::TaskService> service_;
};

} // namespace flowstead::worker
