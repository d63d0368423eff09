#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "flowstead/history/v1/history.pb.h"
#include "internal/workflow/workflow_executor.hpp"

namespace flowstead::workflow {

struct ReplayReport {
  // Recorded commands in command-id order, then the terminal event if any.
  std::vector<flowstead::history::v1::HistoryEvent> decisions;
  ExecutionOutcome                                  outcome = ExecutionOutcome::kSuspended;
  std::string                                       result;
  std::optional<flowstead::core::v1::Failure>       failure;

  // Commands the code would issue next; only for a history that is still open.
  std::vector<flowstead::history::v1::HistoryEvent> pending;
};

/*
  Offline verification of recorded histories against the registered
  workflow code. Any divergence throws util::NonDeterminismError.
*/
class WorkflowReplayer {
 public:
  explicit WorkflowReplayer(std::shared_ptr<const WorkflowRegistry> registry);

  ReplayReport Replay(const flowstead::core::v1::WorkflowExecutionKey& key,
                      const std::vector<flowstead::history::v1::HistoryEvent>& history) const;

 private:
  WorkflowExecutor executor_;
};

} // namespace flowstead::workflow
