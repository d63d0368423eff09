#include "internal/workflow/workflow_executor.hpp"

#include <optional>
#include <set>

#include "internal/history/events.hpp"
#include "internal/util/errors.hpp"

namespace flowstead::workflow {

using namespace flowstead::history::v1;
using flowstead::core::v1::Failure;
using flowstead::core::v1::WorkflowExecutionKey;

namespace {

const CancelRequestedAttributes* FindCancelRequest(const std::vector<HistoryEvent>& history) {
  for (const auto& event : history) {
    if (event.type() == EVENT_TYPE_CANCEL_REQUESTED) return &event.cancel_requested();
  }
  return nullptr;
}

HistoryEvent Failed(util::TimePoint now, Failure failure) {
  auto event = history::MakeEvent(EVENT_TYPE_WORKFLOW_FAILED, now);
  *event.mutable_workflow_failed()->mutable_failure() = std::move(failure);
  return event;
}

Failure MakeFailure(const std::string& message, const std::string& type, flowstead::core::v1::FailureKind kind) {
  Failure failure;
  failure.set_message(message);
  failure.set_type(type);
  failure.set_kind(kind);
  return failure;
}

} // namespace

WorkflowExecutor::WorkflowExecutor(std::shared_ptr<const WorkflowRegistry> registry) : registry_(std::move(registry)) {
}

DecisionResult WorkflowExecutor::Execute(const WorkflowExecutionKey& key, const std::vector<HistoryEvent>& history,
                                         util::TimePoint now, const IdGenerator& new_id, ExecuteMode mode) const {
  DecisionResult  result;
  WorkflowContext context(key, history, now, new_id);
  const auto      fn = registry_->Lookup(context.Info().workflow_type);

  if (mode == ExecuteMode::kDecide) {
    if (const auto* cancel = FindCancelRequest(history)) {
      auto event = history::MakeEvent(EVENT_TYPE_WORKFLOW_CANCELLED, now);
      event.mutable_workflow_cancelled()->set_reason(cancel->reason());
      result.decisions.push_back(std::move(event));
      result.outcome = ExecutionOutcome::kCancelled;
      return result;
    }
  }

  const auto& input = history.front().workflow_started().input();
  std::optional<HistoryEvent> terminal;

  try {
    auto output = fn(context, input);

    auto event = history::MakeEvent(EVENT_TYPE_WORKFLOW_COMPLETED, now);
    event.mutable_workflow_completed()->set_result(std::move(output));
    terminal       = std::move(event);
    result.outcome = ExecutionOutcome::kCompleted;
  } catch (const SuspendExecution&) {
    result.outcome = ExecutionOutcome::kSuspended;
  } catch (const ContinueAsNewRequest& request) {
    auto  event = history::MakeEvent(EVENT_TYPE_WORKFLOW_CONTINUED_AS_NEW, now);
    auto* attrs = event.mutable_workflow_continued_as_new();
    attrs->set_new_run_id(new_id());
    attrs->set_input(request.input);
    terminal       = std::move(event);
    result.outcome = ExecutionOutcome::kContinuedAsNew;
  } catch (const util::NonDeterminismError&) {
    throw;
  } catch (const util::WorkflowExecutionError& e) {
    terminal       = Failed(now, MakeFailure(e.what(), e.Type(), flowstead::core::v1::FAILURE_KIND_APPLICATION));
    result.outcome = ExecutionOutcome::kFailed;
  } catch (const util::ActivityFailure& e) {
    terminal       = Failed(now, e.Failure());
    result.outcome = ExecutionOutcome::kFailed;
  } catch (const util::ChildWorkflowFailure& e) {
    auto failure = MakeFailure(e.what(), e.Failure().type(), flowstead::core::v1::FAILURE_KIND_CHILD_WORKFLOW);
    failure.set_details(e.Failure().SerializeAsString());
    terminal       = Failed(now, std::move(failure));
    result.outcome = ExecutionOutcome::kFailed;
  } catch (const std::exception& e) {
    terminal       = Failed(now, MakeFailure(e.what(), "UnhandledException", flowstead::core::v1::FAILURE_KIND_APPLICATION));
    result.outcome = ExecutionOutcome::kFailed;
  }

  // Workflow code may have caught a divergence as std::exception.
  context.VerifyReplayComplete();

  result.decisions   = context.TakeDecisions();
  result.query_state = context.QueryState();
  if (terminal) result.decisions.push_back(std::move(*terminal));
  return result;
}

PendingWork FindPendingWork(const std::vector<HistoryEvent>& history) {
  std::set<int64_t> resolved;
  for (const auto& event : history) {
    if (!history::IsOutcome(event.type())) continue;
    if (auto id = history::CommandIdOf(event)) resolved.insert(*id);
  }

  PendingWork pending;
  for (const auto& event : history) {
    const auto id = history::CommandIdOf(event);
    if (!id || resolved.count(*id) > 0) continue;

    switch (event.type()) {
      case EVENT_TYPE_ACTIVITY_SCHEDULED:
        pending.activities.push_back(event.activity_scheduled());
        break;
      case EVENT_TYPE_TIMER_STARTED:
        pending.timers.push_back(event.timer_started());
        break;
      case EVENT_TYPE_CHILD_WORKFLOW_STARTED:
        pending.children.push_back(event.child_workflow_started());
        break;
      default:
        break;
    }
  }
  return pending;
}

} // namespace flowstead::workflow
