#include "task_service.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/activity/activity_registry.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/workflow/workflow_registry.hpp"
#include "observe_rpc.hpp"

namespace flowstead::service {

using namespace flowstead::services::v1;

namespace {

// Upper bound for one long poll; workers re-poll.
constexpr util::Millis kMaxPollWait{60000};

} // namespace

TaskService::TaskService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterWorkerResponse TaskService::RegisterWorker(const RegisterWorkerRequest& req) {
  return ObserveRpc("TaskService.RegisterWorker", "", [&] {
    if (req.task_queue().empty()) {
      throw std::invalid_argument("register worker: task_queue is required");
    }

    ctx_.workflows->Validate(std::vector<std::string>(req.workflow_types().begin(), req.workflow_types().end()));
    ctx_.activities->Validate(std::vector<std::string>(req.activity_types().begin(), req.activity_types().end()));

    RegisterWorkerResponse resp;
    resp.set_worker_id(req.worker_id().empty() ? util::NewId() : req.worker_id());
    {
      std::lock_guard lock(mutex_);
      workers_[resp.worker_id()] = req.task_queue();
    }

    FLOWSTEAD_LOG_INFO("Worker registered", {observability::StringField("worker_id", resp.worker_id()),
                                             observability::StringField("task_queue", req.task_queue()),
                                             observability::IntField("activity_types", req.activity_types_size())});
    return resp;
  });
}

PollActivityTaskResponse TaskService::PollActivityTask(const PollActivityTaskRequest& req) {
  return ObserveRpc("TaskService.PollActivityTask", "", [&] {
    if (req.task_queue().empty()) {
      throw std::invalid_argument("poll: task_queue is required");
    }

    const auto wait = std::min(util::FromProto(req.timeout()), kMaxPollWait);

    PollActivityTaskResponse resp;
    auto task = wait.count() > 0 ? ctx_.engine->task_queue()->Poll(req.task_queue(), req.worker_id(), wait)
                                 : ctx_.engine->task_queue()->TryPoll(req.task_queue(), req.worker_id());
    if (task) {
      *resp.mutable_task() = std::move(*task);
    }
    return resp;
  });
}

void TaskService::CompleteActivityTask(const CompleteActivityTaskRequest& req) {
  ObserveRpc("TaskService.CompleteActivityTask", "", [&] {
    if (req.task_id().empty()) {
      throw std::invalid_argument("complete: task_id is required");
    }
    if (req.attempt() < 1) {
      throw std::invalid_argument("complete: attempt must be at least 1");
    }
    ctx_.engine->activities()->Complete(req.task_id(), req.attempt(), req.result());
  });
}

void TaskService::FailActivityTask(const FailActivityTaskRequest& req) {
  ObserveRpc("TaskService.FailActivityTask", "", [&] {
    if (req.task_id().empty()) {
      throw std::invalid_argument("fail: task_id is required");
    }
    if (req.attempt() < 1) {
      throw std::invalid_argument("fail: attempt must be at least 1");
    }
    ctx_.engine->activities()->Fail(req.task_id(), req.attempt(), req.failure(), req.retryable());
  });
}

} // namespace flowstead::service
