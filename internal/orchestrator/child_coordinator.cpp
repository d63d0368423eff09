#include "internal/orchestrator/child_coordinator.hpp"

#include "internal/history/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/execution_key.hpp"

namespace flowstead::orchestrator {

using namespace flowstead::history::v1;
using flowstead::core::v1::Failure;
using flowstead::core::v1::WorkflowExecutionKey;

namespace {

// Bound on continue-as-new hops followed when looking for the open run.
constexpr int kMaxRunHops = 64;

HistoryEvent StartFailed(const ChildWorkflowStartedAttributes& child, util::TimePoint now, const std::string& type,
                         const std::string& message) {
  auto  event = history::MakeEvent(EVENT_TYPE_CHILD_WORKFLOW_FAILED, now);
  auto* attrs = event.mutable_child_workflow_failed();
  attrs->set_command_id(child.command_id());
  *attrs->mutable_child() = child.child();

  auto* failure = attrs->mutable_failure();
  failure->set_type(type);
  failure->set_message(message);
  failure->set_kind(flowstead::core::v1::FAILURE_KIND_APPLICATION);
  failure->set_non_retryable(true);
  return event;
}

} // namespace

ChildCoordinator::ChildCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::ExecutionStore> executions,
                                   std::shared_ptr<history::Inbox> inbox, std::shared_ptr<const workflow::WorkflowRegistry> registry)
    : repository_(std::move(repository)),
      executions_(std::move(executions)),
      inbox_(std::move(inbox)),
      registry_(std::move(registry)) {
}

std::optional<HistoryEvent> ChildCoordinator::StartChild(db::Transaction& tx, const WorkflowExecutionKey& parent,
                                                         const ChildWorkflowStartedAttributes& child, util::TimePoint now) {
  if (!registry_->Contains(child.workflow_type())) {
    return StartFailed(child, now, "WorkflowTypeNotFound", "workflow type not registered: " + child.workflow_type());
  }

  history::NewRun run;
  run.key               = child.child();
  run.workflow_type     = child.workflow_type();
  run.task_queue        = child.task_queue();
  run.input             = child.input();
  run.run_timeout       = util::FromProto(child.run_timeout());
  run.parent            = parent;
  run.parent_command_id = child.command_id();

  try {
    executions_->Create(tx, run, now);
  } catch (const util::AlreadyExists& e) {
    FLOWSTEAD_LOG_WARN("Child workflow id already in use", {observability::StringField("parent", util::KeyString(parent)),
                                                            observability::StringField("child", child.child().workflow_id())});
    return StartFailed(child, now, "WorkflowAlreadyStarted", e.what());
  }
  return std::nullopt;
}

std::optional<WorkflowExecutionKey> ChildCoordinator::RequestCancel(db::Transaction& tx, const WorkflowExecutionKey& child,
                                                                    const std::string& reason, util::TimePoint now) {
  auto record = repository_->GetExecution(tx, child.workflow_id(), child.run_id());
  for (int hop = 0; record && hop < kMaxRunHops; ++hop) {
    if (record->status != flowstead::core::v1::WORKFLOW_STATUS_CONTINUED_AS_NEW || record->continued_as_run_id.empty()) break;
    record = repository_->GetExecution(tx, record->workflow_id, record->continued_as_run_id);
  }
  if (!record || record->status != flowstead::core::v1::WORKFLOW_STATUS_RUNNING) {
    return std::nullopt;
  }

  const auto key   = util::MakeKey(record->workflow_id, record->run_id);
  auto       event = history::MakeEvent(EVENT_TYPE_CANCEL_REQUESTED, now);
  event.mutable_cancel_requested()->set_reason(reason);
  inbox_->Post(tx, key, event);
  return key;
}

std::optional<WorkflowExecutionKey> ChildCoordinator::ReportToParent(db::Transaction& tx, const db::model::ExecutionRecord& closed,
                                                                     const HistoryEvent& terminal) {
  if (closed.parent_workflow_id.empty()) return std::nullopt;

  auto parent = repository_->GetExecution(tx, closed.parent_workflow_id, closed.parent_run_id);
  if (!parent || parent->status != flowstead::core::v1::WORKFLOW_STATUS_RUNNING) {
    return std::nullopt;
  }

  const auto child_key  = util::MakeKey(closed.workflow_id, closed.run_id);
  const auto parent_key = util::MakeKey(parent->workflow_id, parent->run_id);
  const auto now        = util::FromProto(terminal.timestamp());

  HistoryEvent event;
  if (terminal.type() == EVENT_TYPE_WORKFLOW_COMPLETED) {
    event       = history::MakeEvent(EVENT_TYPE_CHILD_WORKFLOW_COMPLETED, now);
    auto* attrs = event.mutable_child_workflow_completed();
    attrs->set_command_id(closed.parent_command_id);
    *attrs->mutable_child() = child_key;
    attrs->set_result(closed.result);
  } else {
    event       = history::MakeEvent(EVENT_TYPE_CHILD_WORKFLOW_FAILED, now);
    auto* attrs = event.mutable_child_workflow_failed();
    attrs->set_command_id(closed.parent_command_id);
    *attrs->mutable_child() = child_key;
    attrs->set_status(closed.status);

    Failure failure;
    if (closed.failure.empty() || !failure.ParseFromString(closed.failure)) {
      failure.set_message("child workflow closed as " + history::StatusName(closed.status));
    }
    *attrs->mutable_failure() = std::move(failure);
  }

  inbox_->Post(tx, parent_key, event);
  return parent_key;
}

} // namespace flowstead::orchestrator
