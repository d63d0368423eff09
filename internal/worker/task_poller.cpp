#include "task_poller.hpp"

#include "internal/service/task_service.hpp"

namespace flowstead::worker {

using namespace flowstead::services::v1;

LocalTaskPoller::LocalTaskPoller(std::shared_ptr<service::TaskService> service) : service_(std::move(service)) {
}

std::string LocalTaskPoller::Register(const std::string& worker_id, const std::string& task_queue,
                                      const std::vector<std::string>& activity_types) {
  RegisterWorkerRequest req;
  req.set_worker_id(worker_id);
  req.set_task_queue(task_queue);
  for (const auto& type : activity_types) {
    req.add_activity_types(type);
  }
  return service_->RegisterWorker(req).worker_id();
}

std::optional<flowstead::runtime::v1::ActivityTask> LocalTaskPoller::Poll(const std::string& worker_id,
                                                                          const std::string& task_queue, util::Millis wait) {
  PollActivityTaskRequest req;
  req.set_worker_id(worker_id);
  req.set_task_queue(task_queue);
  *req.mutable_timeout() = util::ToProto(wait);

  auto resp = service_->PollActivityTask(req);
  if (!resp.has_task()) {
    return std::nullopt;
  }
  return std::move(*resp.mutable_task());
}

void LocalTaskPoller::Complete(const flowstead::runtime::v1::ActivityTask& task, const std::string& result) {
  CompleteActivityTaskRequest req;
  req.set_task_id(task.task_id());
  req.set_attempt(task.attempt());
  req.set_result(result);
  service_->CompleteActivityTask(req);
}

void LocalTaskPoller::Fail(const flowstead::runtime::v1::ActivityTask& task, const flowstead::core::v1::Failure& failure,
                           bool retryable) {
  FailActivityTaskRequest req;
  req.set_task_id(task.task_id());
  req.set_attempt(task.attempt());
  *req.mutable_failure() = failure;
  req.set_retryable(retryable);
  service_->FailActivityTask(req);
}

} // namespace flowstead::worker
