#include "activity_worker.hpp"

#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstead::worker {

using flowstead::core::v1::Failure;
using flowstead::runtime::v1::ActivityTask;

namespace {

Failure MakeFailure(const std::string& message, const std::string& type, bool non_retryable) {
  Failure failure;
  failure.set_message(message);
  failure.set_type(type);
  failure.set_non_retryable(non_retryable);
  failure.set_kind(flowstead::core::v1::FAILURE_KIND_APPLICATION);
  return failure;
}

} // namespace

ActivityWorker::ActivityWorker(WorkerOptions options, std::shared_ptr<const activity::ActivityRegistry> registry,
                               std::shared_ptr<TaskPoller> poller)
    : options_(std::move(options)), registry_(std::move(registry)), poller_(std::move(poller)) {
}

ActivityWorker::~ActivityWorker() {
  Stop();
}

void ActivityWorker::EnsureRegistered() {
  if (!worker_id_.empty()) return;
  worker_id_ = poller_->Register(options_.worker_id, options_.task_queue, registry_->Names());
  FLOWSTEAD_LOG_INFO("Activity worker registered", {observability::StringField("worker_id", worker_id_),
                                                    observability::StringField("task_queue", options_.task_queue)});
}

void ActivityWorker::Start() {
  if (running_.exchange(true)) return;
  EnsureRegistered();
  for (int i = 0; i < options_.threads; ++i) {
    threads_.emplace_back(&ActivityWorker::Run, this);
  }
}

void ActivityWorker::Stop() {
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

std::size_t ActivityWorker::ProcessAvailable() {
  EnsureRegistered();
  std::size_t executed = 0;
  while (auto task = poller_->Poll(worker_id_, options_.task_queue, util::Millis{0})) {
    Execute(*task);
    ++executed;
  }
  return executed;
}

void ActivityWorker::Run() {
  while (running_) {
    try {
      auto task = poller_->Poll(worker_id_, options_.task_queue, options_.poll_wait);
      if (task) Execute(*task);
    } catch (const std::exception& e) {
      FLOWSTEAD_LOG_WARN("Activity poll failed", {observability::StringField("worker_id", worker_id_),
                                                  observability::StringField("error", e.what())});
      std::this_thread::sleep_for(options_.error_backoff);
    }
  }
}

void ActivityWorker::Execute(const ActivityTask& task) {
  std::optional<std::string> result;
  Failure                    failure;
  bool                       retryable = true;

  if (!registry_->Contains(task.activity_type())) {
    failure   = MakeFailure("activity type not registered: " + task.activity_type(), "ActivityTypeNotFound", true);
    retryable = false;
  } else {
    const auto fn = registry_->Lookup(task.activity_type());
    try {
      result = fn(activity::ActivityContext{task}, task.input());
    } catch (const util::NonRetryableActivityError& e) {
      failure   = MakeFailure(e.what(), e.Type(), true);
      retryable = false;
    } catch (const util::TransientActivityError& e) {
      failure = MakeFailure(e.what(), e.Type(), false);
    } catch (const std::exception& e) {
      failure = MakeFailure(e.what(), "ActivityError", false);
    } catch (...) {
      // Non-standard exceptions are retryable failures too.
      failure = MakeFailure("activity " + task.activity_type() + " threw a non-standard exception", "ActivityError", false);
    }
  }

  // The engine may have already timed the attempt out and moved on; the
  // late report is rejected with NotFound.
  try {
    if (result) {
      poller_->Complete(task, *result);
    } else {
      FLOWSTEAD_LOG_DEBUG("Activity attempt failed", {observability::StringField("activity_type", task.activity_type()),
                                                      observability::IntField("attempt", task.attempt()),
                                                      observability::StringField("error", failure.message())});
      poller_->Fail(task, failure, retryable);
    }
  } catch (const util::NotFound& e) {
    FLOWSTEAD_LOG_WARN("Activity report rejected", {observability::StringField("task_id", task.task_id()),
                                                    observability::StringField("error", e.what())});
  }
}

} // namespace flowstead::worker
