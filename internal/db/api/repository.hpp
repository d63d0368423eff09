#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/execution_record.hpp"
#include "internal/db/model/inbox_record.hpp"
#include "internal/db/model/run_lock_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/timer_record.hpp"

namespace flowstead::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - AppendEvents is all-or-nothing and contiguous with expected_seq
  - RunLock fencing depends on reads and writes sharing the transaction

  The DB is the source of truth for:
    run histories
    pending work (inbox, tasks, timers)
    run locks
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Executions
  // ---------------------------------------------------------------------

  virtual Result InsertExecution(Transaction&, const model::ExecutionRecord&) = 0;

  virtual std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string& workflow_id, const std::string& run_id) = 0;

  // The run flagged is_current for this workflow id.
  virtual std::optional<model::ExecutionRecord> GetCurrentExecution(Transaction&, const std::string& workflow_id) = 0;

  virtual Result UpdateExecution(Transaction&, const model::ExecutionRecord&) = 0;

  // Rows strictly after `after` in (start_time_ms, run_id) order. limit 0 = all.
  virtual std::vector<model::ExecutionRecord> ListExecutions(Transaction&, const model::ExecutionFilter& filter,
                                                             const std::optional<model::ExecutionCursor>& after, std::size_t limit) = 0;

  // Running and not halted.
  virtual std::vector<model::ExecutionRecord> ListOpenExecutions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // History
  // ---------------------------------------------------------------------

  // Assigns seq = expected_seq, expected_seq + 1, ... to the batch.
  // Returns Conflict when the stored length differs from expected_seq.
  virtual Result AppendEvents(Transaction&, const std::string& workflow_id, const std::string& run_id, int64_t expected_seq,
                              std::vector<model::EventRecord>& events) = 0;

  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& workflow_id, const std::string& run_id,
                                                     int64_t from_seq) = 0;

  virtual int64_t CountEvents(Transaction&, const std::string& workflow_id, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Inbox
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertInbox(Transaction&, model::InboxRecord& record) = 0;

  // Ordered by id.
  virtual std::vector<model::InboxRecord> ListInbox(Transaction&, const std::string& workflow_id, const std::string& run_id) = 0;

  virtual Result DeleteInbox(Transaction&, uint64_t id) = 0;

  // ---------------------------------------------------------------------
  // Run locks
  // ---------------------------------------------------------------------

  // Backends with concurrent writers lock the run for the rest of the transaction.
  virtual std::optional<model::RunLockRecord> GetRunLock(Transaction&, const std::string& workflow_id, const std::string& run_id) = 0;

  virtual Result UpsertRunLock(Transaction&, const model::RunLockRecord&) = 0;

  virtual Result DeleteRunLock(Transaction&, const std::string& workflow_id, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Activity tasks
  // ---------------------------------------------------------------------

  virtual Result InsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& task_id) = 0;

  virtual Result UpdateTask(Transaction&, const model::TaskRecord&) = 0;

  virtual Result DeleteTask(Transaction&, const std::string& task_id) = 0;

  // Unleased tasks with visible_at_ms <= now_ms, oldest first.
  virtual std::vector<model::TaskRecord> ListVisibleTasks(Transaction&, const std::string& task_queue, uint64_t now_ms, std::size_t limit) = 0;

  // Leased tasks past their lease, and unleased tasks past schedule_to_start.
  virtual std::vector<model::TaskRecord> ListExpiredTasks(Transaction&, uint64_t now_ms) = 0;

  virtual std::vector<model::TaskRecord> ListTasksForRun(Transaction&, const std::string& workflow_id, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Timers
  // ---------------------------------------------------------------------

  virtual Result InsertTimer(Transaction&, const model::TimerRecord&) = 0;

  virtual std::vector<model::TimerRecord> ListDueTimers(Transaction&, uint64_t now_ms) = 0;

  virtual std::vector<model::TimerRecord> ListTimersForRun(Transaction&, const std::string& workflow_id, const std::string& run_id) = 0;

  virtual Result DeleteTimer(Transaction&, const std::string& workflow_id, const std::string& run_id, int64_t command_id) = 0;
};

} // namespace flowstead::db
