#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "flowstead/core/v1/types.pb.h"

namespace flowstead::db::model {

/*
  Projection of one run's history, maintained in the same transaction as
  every append. History stays the source of truth.
*/
struct ExecutionRecord {
  std::string workflow_id;
  std::string run_id;
  std::string workflow_type;
  std::string task_queue;
  std::string input;

  flowstead::core::v1::WorkflowStatus status = flowstead::core::v1::WORKFLOW_STATUS_RUNNING;

  std::string result;
  std::string failure; // serialized core::v1::Failure

  std::string parent_workflow_id;
  std::string parent_run_id;
  int64_t     parent_command_id = 0;

  uint64_t start_time_ms   = 0;
  uint64_t close_time_ms   = 0;
  uint64_t run_deadline_ms = 0; // 0 = no run timeout

  int64_t history_length = 0;
  bool    is_current     = true;

  bool        halted = false;
  std::string halt_reason;

  std::string continued_from_run_id;
  std::string continued_as_run_id;
};

struct ExecutionFilter {
  std::optional<flowstead::core::v1::WorkflowStatus> status;
  std::optional<std::string>                         workflow_type;
};

// Listing order is (start_time_ms, run_id); a cursor names the last row seen.
struct ExecutionCursor {
  uint64_t    start_time_ms = 0;
  std::string run_id;
};

} // namespace flowstead::db::model
