#include "internal/history/execution_store.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/execution_key.hpp"

namespace flowstead::history {

using namespace flowstead::history::v1;
using flowstead::core::v1::WorkflowExecutionKey;

ExecutionStore::ExecutionStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<EventLog> event_log)
    : repository_(std::move(repository)), event_log_(std::move(event_log)) {
}

db::model::ExecutionRecord ExecutionStore::Create(db::Transaction& tx, const NewRun& run, util::TimePoint now) {
  if (auto current = repository_->GetCurrentExecution(tx, run.key.workflow_id())) {
    if (current->status == flowstead::core::v1::WORKFLOW_STATUS_RUNNING) {
      throw util::AlreadyExists("workflow already running: " + run.key.workflow_id() + " (run " + current->run_id + ")");
    }
    current->is_current = false;
    Save(tx, *current);
  }

  db::model::ExecutionRecord record;
  record.workflow_id           = run.key.workflow_id();
  record.run_id                = run.key.run_id();
  record.workflow_type         = run.workflow_type;
  record.task_queue            = run.task_queue;
  record.input                 = run.input;
  record.status                = flowstead::core::v1::WORKFLOW_STATUS_RUNNING;
  record.parent_workflow_id    = run.parent.workflow_id();
  record.parent_run_id         = run.parent.run_id();
  record.parent_command_id     = run.parent_command_id;
  record.start_time_ms         = util::ToUnixMillis(now);
  record.run_deadline_ms       = run.run_timeout.count() > 0 ? util::ToUnixMillis(now + run.run_timeout) : 0;
  record.history_length        = 1;
  record.is_current            = true;
  record.continued_from_run_id = run.continued_from_run_id;

  db::ThrowIfError(repository_->InsertExecution(tx, record), "create execution " + util::KeyString(run.key));

  auto  started = MakeEvent(EVENT_TYPE_WORKFLOW_STARTED, now);
  auto* attrs   = started.mutable_workflow_started();
  attrs->set_workflow_type(run.workflow_type);
  attrs->set_task_queue(run.task_queue);
  attrs->set_input(run.input);
  if (run.run_timeout.count() > 0) {
    *attrs->mutable_run_timeout() = util::ToProto(run.run_timeout);
  }
  if (!run.parent.workflow_id().empty()) {
    *attrs->mutable_parent() = run.parent;
    attrs->set_parent_command_id(run.parent_command_id);
  }
  attrs->set_continued_from_run_id(run.continued_from_run_id);

  std::vector<HistoryEvent> events{std::move(started)};
  db::ThrowIfError(event_log_->AppendInTransaction(tx, run.key, 0, events), "start history " + util::KeyString(run.key));
  return record;
}

db::model::ExecutionRecord ExecutionStore::Require(db::Transaction& tx, const WorkflowExecutionKey& key) {
  auto record = key.run_id().empty() ? repository_->GetCurrentExecution(tx, key.workflow_id())
                                     : repository_->GetExecution(tx, key.workflow_id(), key.run_id());
  if (!record) {
    throw util::NotFound("workflow execution not found: " + util::KeyString(key));
  }
  return *record;
}

void ExecutionStore::Save(db::Transaction& tx, const db::model::ExecutionRecord& record) {
  db::ThrowIfError(repository_->UpdateExecution(tx, record),
                   "update execution " + record.workflow_id + "/" + record.run_id);
}

void ExecutionStore::Project(db::model::ExecutionRecord& record, const std::vector<HistoryEvent>& appended) {
  record.history_length += static_cast<int64_t>(appended.size());

  for (const auto& event : appended) {
    if (!IsTerminal(event.type())) continue;

    record.status        = TerminalStatus(event.type());
    record.close_time_ms = util::ToUnixMillis(util::FromProto(event.timestamp()));
    switch (event.type()) {
      case EVENT_TYPE_WORKFLOW_COMPLETED:
        record.result = event.workflow_completed().result();
        break;
      case EVENT_TYPE_WORKFLOW_FAILED:
        record.failure = event.workflow_failed().failure().SerializeAsString();
        break;
      case EVENT_TYPE_WORKFLOW_CANCELLED: {
        flowstead::core::v1::Failure failure;
        failure.set_kind(flowstead::core::v1::FAILURE_KIND_CANCELLED);
        failure.set_type("WorkflowCancelled");
        failure.set_message(event.workflow_cancelled().reason().empty() ? "workflow cancelled" : event.workflow_cancelled().reason());
        record.failure = failure.SerializeAsString();
        break;
      }
      case EVENT_TYPE_WORKFLOW_TIMED_OUT: {
        flowstead::core::v1::Failure failure;
        failure.set_kind(flowstead::core::v1::FAILURE_KIND_TIMEOUT);
        failure.set_type("WorkflowTimedOut");
        failure.set_message("workflow run timeout elapsed");
        record.failure = failure.SerializeAsString();
        break;
      }
      case EVENT_TYPE_WORKFLOW_CONTINUED_AS_NEW:
        record.continued_as_run_id = event.workflow_continued_as_new().new_run_id();
        record.is_current          = false;
        break;
      default:
        break;
    }
  }
}

} // namespace flowstead::history
