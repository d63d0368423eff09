#include "internal/workflow/workflow_replayer.hpp"

#include <stdexcept>

#include "internal/history/events.hpp"
#include "internal/util/errors.hpp"

namespace flowstead::workflow {

using namespace flowstead::history::v1;
using flowstead::core::v1::WorkflowExecutionKey;

namespace {

ExecutionOutcome OutcomeOf(EventType terminal) {
  switch (terminal) {
    case EVENT_TYPE_WORKFLOW_COMPLETED:
      return ExecutionOutcome::kCompleted;
    case EVENT_TYPE_WORKFLOW_FAILED:
      return ExecutionOutcome::kFailed;
    case EVENT_TYPE_WORKFLOW_CANCELLED:
      return ExecutionOutcome::kCancelled;
    case EVENT_TYPE_WORKFLOW_TIMED_OUT:
      return ExecutionOutcome::kTimedOut;
    case EVENT_TYPE_WORKFLOW_CONTINUED_AS_NEW:
      return ExecutionOutcome::kContinuedAsNew;
    default:
      return ExecutionOutcome::kSuspended;
  }
}

[[noreturn]] void Mismatch(const WorkflowExecutionKey& key, const std::string& detail) {
  throw util::NonDeterminismError("replay of " + key.workflow_id() + "/" + key.run_id() + " diverged: " + detail);
}

void CompareTerminal(const WorkflowExecutionKey& key, const HistoryEvent& recorded, const HistoryEvent& replayed) {
  if (recorded.type() != replayed.type()) {
    Mismatch(key, "history closed with " + history::EventTypeName(recorded.type()) + ", replay produced " +
                      history::EventTypeName(replayed.type()));
  }

  switch (recorded.type()) {
    case EVENT_TYPE_WORKFLOW_COMPLETED:
      if (recorded.workflow_completed().result() != replayed.workflow_completed().result()) {
        Mismatch(key, "workflow result differs");
      }
      break;
    case EVENT_TYPE_WORKFLOW_FAILED: {
      const auto& a = recorded.workflow_failed().failure();
      const auto& b = replayed.workflow_failed().failure();
      if (a.type() != b.type() || a.message() != b.message()) {
        Mismatch(key, "failure differs: recorded " + a.type() + " '" + a.message() + "', replayed " + b.type() + " '" +
                          b.message() + "'");
      }
      break;
    }
    case EVENT_TYPE_WORKFLOW_CONTINUED_AS_NEW:
      if (recorded.workflow_continued_as_new().input() != replayed.workflow_continued_as_new().input()) {
        Mismatch(key, "continue-as-new input differs");
      }
      break;
    default:
      break;
  }
}

} // namespace

WorkflowReplayer::WorkflowReplayer(std::shared_ptr<const WorkflowRegistry> registry) : executor_(std::move(registry)) {
}

ReplayReport WorkflowReplayer::Replay(const WorkflowExecutionKey& key, const std::vector<HistoryEvent>& history) const {
  if (history.empty()) {
    throw std::invalid_argument("cannot replay an empty history");
  }

  std::optional<HistoryEvent> recorded_terminal;
  std::vector<HistoryEvent>   body = history;
  if (history::IsTerminal(body.back().type())) {
    recorded_terminal = body.back();
    body.pop_back();
  }

  const auto now    = util::FromProto((recorded_terminal ? *recorded_terminal : body.back()).timestamp());
  const auto new_id = [&]() -> std::string {
    if (recorded_terminal && recorded_terminal->type() == EVENT_TYPE_WORKFLOW_CONTINUED_AS_NEW) {
      return recorded_terminal->workflow_continued_as_new().new_run_id();
    }
    return "replay";
  };

  auto replayed = executor_.Execute(key, body, now, new_id, ExecuteMode::kQuery);

  std::optional<HistoryEvent> replayed_terminal;
  if (!replayed.decisions.empty() && history::IsTerminal(replayed.decisions.back().type())) {
    replayed_terminal = std::move(replayed.decisions.back());
    replayed.decisions.pop_back();
  }

  ReplayReport report;
  for (const auto& event : body) {
    if (history::IsCommand(event.type())) report.decisions.push_back(event);
  }

  if (!recorded_terminal) {
    if (replayed_terminal) {
      Mismatch(key, "history is open but replay produced " + history::EventTypeName(replayed_terminal->type()));
    }
    report.pending = std::move(replayed.decisions);
    return report;
  }

  const auto recorded_type = recorded_terminal->type();
  // Cancellation and run timeouts close the run without running the code
  // past its last recorded decision.
  if (recorded_type != EVENT_TYPE_WORKFLOW_CANCELLED && recorded_type != EVENT_TYPE_WORKFLOW_TIMED_OUT) {
    if (!replayed.decisions.empty()) {
      Mismatch(key, "replay produced " + history::EventTypeName(replayed.decisions.front().type()) +
                        " after the last recorded command");
    }
    if (!replayed_terminal) {
      Mismatch(key, "history closed with " + history::EventTypeName(recorded_type) + " but replay suspended");
    }
    CompareTerminal(key, *recorded_terminal, *replayed_terminal);
  }

  report.outcome = OutcomeOf(recorded_type);
  if (recorded_type == EVENT_TYPE_WORKFLOW_COMPLETED) {
    report.result = recorded_terminal->workflow_completed().result();
  } else if (recorded_type == EVENT_TYPE_WORKFLOW_FAILED) {
    report.failure = recorded_terminal->workflow_failed().failure();
  }
  report.decisions.push_back(std::move(*recorded_terminal));
  return report;
}

} // namespace flowstead::workflow
