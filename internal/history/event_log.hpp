#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/history/events.hpp"

namespace flowstead::history {

/*
  EventLog

  Append-only, seq-ordered history of one workflow run, keyed by
  (workflow_id, run_id). Sequence numbers start at 0 and are assigned
  on append.

  Append is atomic per batch: every event lands contiguous with
  expected_seq, or none do. A length mismatch returns
  ErrorCode::Conflict, meaning another writer got there first; the
  caller must abandon its decision and reacquire the RunLock.
*/
class EventLog {
 public:
  explicit EventLog(std::shared_ptr<db::Repository> repository);

  // Runs in its own transaction.
  db::Result Append(const flowstead::core::v1::WorkflowExecutionKey& key, int64_t expected_seq,
                    std::vector<HistoryEvent>& events);

  // Joins the caller's transaction so the batch commits with its side effects.
  db::Result AppendInTransaction(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                                 int64_t expected_seq, std::vector<HistoryEvent>& events);

  std::vector<HistoryEvent> Read(const flowstead::core::v1::WorkflowExecutionKey& key, int64_t from_seq = 0);
  std::vector<HistoryEvent> ReadInTransaction(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                                              int64_t from_seq = 0);

  int64_t Length(const flowstead::core::v1::WorkflowExecutionKey& key);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace flowstead::history
