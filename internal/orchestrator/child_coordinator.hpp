#pragma once

#include <memory>
#include <optional>
#include <string>

#include "flowstead/core/v1/types.pb.h"
#include "flowstead/history/v1/history.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/history/execution_store.hpp"
#include "internal/history/inbox.hpp"
#include "internal/workflow/workflow_registry.hpp"

namespace flowstead::orchestrator {

/*
  ChildCoordinator

  Engine side of fan-out. Runs inside the parent's (or the closing
  child's) decision transaction:
    - StartChild creates the child run for a ChildWorkflowStarted decision
    - RequestCancel delivers CancelRequested to a running child
    - ReportToParent posts a closed child's outcome to its parent's inbox
*/
class ChildCoordinator {
 public:
  ChildCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::ExecutionStore> executions,
                   std::shared_ptr<history::Inbox> inbox, std::shared_ptr<const workflow::WorkflowRegistry> registry);

  // Returns the ChildWorkflowFailed event to record for the parent when
  // the child cannot be started; nullopt once the child run exists.
  std::optional<flowstead::history::v1::HistoryEvent> StartChild(db::Transaction& tx,
                                                                 const flowstead::core::v1::WorkflowExecutionKey& parent,
                                                                 const flowstead::history::v1::ChildWorkflowStartedAttributes& child,
                                                                 util::TimePoint now);

  // Follows continue-as-new to the run that is still open. Returns the
  // key that received the request, if any.
  std::optional<flowstead::core::v1::WorkflowExecutionKey> RequestCancel(db::Transaction& tx,
                                                                         const flowstead::core::v1::WorkflowExecutionKey& child,
                                                                         const std::string& reason, util::TimePoint now);

  // `closed` is the final projection of a child run. Returns the parent
  // key when the outcome was posted.
  std::optional<flowstead::core::v1::WorkflowExecutionKey> ReportToParent(db::Transaction& tx,
                                                                          const db::model::ExecutionRecord& closed,
                                                                          const flowstead::history::v1::HistoryEvent& terminal);

 private:
  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<history::ExecutionStore>          executions_;
  std::shared_ptr<history::Inbox>                   inbox_;
  std::shared_ptr<const workflow::WorkflowRegistry> registry_;
};

} // namespace flowstead::orchestrator
