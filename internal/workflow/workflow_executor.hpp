#pragma once

#include <memory>
#include <string>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "flowstead/history/v1/history.pb.h"
#include "internal/workflow/workflow_context.hpp"
#include "internal/workflow/workflow_registry.hpp"

namespace flowstead::workflow {

enum class ExecutionOutcome {
  kSuspended,
  kCompleted,
  kFailed,
  kCancelled,
  kContinuedAsNew,
  kTimedOut, // only reported by the replayer; run timeouts are engine-enforced
};

enum class ExecuteMode {
  kDecide, // a decision cycle: cancellation requests are honoured
  kQuery,  // read-only replay for a query snapshot
};

struct DecisionResult {
  // Command events followed, when the run closes, by its terminal event.
  std::vector<flowstead::history::v1::HistoryEvent> decisions;
  ExecutionOutcome                                  outcome = ExecutionOutcome::kSuspended;
  std::string                                       query_state;
};

/*
  WorkflowExecutor

  Replays a run's workflow code from the start of its history and
  returns the decisions the code produces past the recorded end.
  Exceptions raised by workflow code become a WorkflowFailed decision;
  util::NonDeterminismError propagates to the caller.
*/
class WorkflowExecutor {
 public:
  explicit WorkflowExecutor(std::shared_ptr<const WorkflowRegistry> registry);

  DecisionResult Execute(const flowstead::core::v1::WorkflowExecutionKey& key,
                         const std::vector<flowstead::history::v1::HistoryEvent>& history, util::TimePoint now,
                         const IdGenerator& new_id, ExecuteMode mode = ExecuteMode::kDecide) const;

 private:
  std::shared_ptr<const WorkflowRegistry> registry_;
};

// Commands in `history` without a recorded outcome.
struct PendingWork {
  std::vector<flowstead::history::v1::ActivityScheduledAttributes>    activities;
  std::vector<flowstead::history::v1::TimerStartedAttributes>         timers;
  std::vector<flowstead::history::v1::ChildWorkflowStartedAttributes> children;
};

PendingWork FindPendingWork(const std::vector<flowstead::history::v1::HistoryEvent>& history);

} // namespace flowstead::workflow
