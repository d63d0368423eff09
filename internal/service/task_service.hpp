#pragma once

#include <map>
#include <mutex>
#include <string>

#include "flowstead/services/v1/task_service.pb.h"
#include "service_context.hpp"

namespace flowstead::service {

/*
  Worker-facing protocol: register, poll, complete, fail.

  Registration is validated eagerly: a worker naming a workflow or
  activity type the engine does not know is rejected with NotFound.
*/
class TaskService {
 public:
  explicit TaskService(ServiceContext ctx);

  flowstead::services::v1::RegisterWorkerResponse RegisterWorker(const flowstead::services::v1::RegisterWorkerRequest& req);

  flowstead::services::v1::PollActivityTaskResponse PollActivityTask(const flowstead::services::v1::PollActivityTaskRequest& req);

  void CompleteActivityTask(const flowstead::services::v1::CompleteActivityTaskRequest& req);

  void FailActivityTask(const flowstead::services::v1::FailActivityTaskRequest& req);

 private:
  ServiceContext ctx_;

  std::mutex                         mutex_;
  std::map<std::string, std::string> workers_; // worker id -> task queue
};

} // namespace flowstead::service
