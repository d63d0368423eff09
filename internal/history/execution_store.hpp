#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/history/event_log.hpp"
#include "internal/util/time.hpp"

namespace flowstead::history {

struct NewRun {
  flowstead::core::v1::WorkflowExecutionKey key;
  std::string                               workflow_type;
  std::string                               task_queue;
  std::string                               input;
  util::Millis                              run_timeout{0};

  flowstead::core::v1::WorkflowExecutionKey parent;
  int64_t                                   parent_command_id = 0;
  std::string                               continued_from_run_id;
};

/*
  ExecutionStore

  Creates runs (execution row + WorkflowStarted at seq 0) and keeps the
  execution row in step with appended history.
*/
class ExecutionStore {
 public:
  ExecutionStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<EventLog> event_log);

  // Throws util::AlreadyExists when a running execution owns the workflow id.
  // A closed current run stops being current.
  db::model::ExecutionRecord Create(db::Transaction& tx, const NewRun& run, util::TimePoint now);

  // Empty run_id resolves to the current run. Throws util::NotFound.
  db::model::ExecutionRecord Require(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key);

  void Save(db::Transaction& tx, const db::model::ExecutionRecord& record);

  // Folds appended events into the row: length, and on a terminal event
  // status, close time, result or failure.
  static void Project(db::model::ExecutionRecord& record, const std::vector<HistoryEvent>& appended);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<EventLog>       event_log_;
};

} // namespace flowstead::history
