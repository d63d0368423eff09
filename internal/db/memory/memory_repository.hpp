#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flowstead::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string& workflow_id,
                                                     const std::string& run_id) override;
  std::optional<model::ExecutionRecord> GetCurrentExecution(Transaction&, const std::string& workflow_id) override;
  Result UpdateExecution(Transaction&, const model::ExecutionRecord&) override;
  std::vector<model::ExecutionRecord> ListExecutions(Transaction&, const model::ExecutionFilter& filter,
                                                     const std::optional<model::ExecutionCursor>& after,
                                                     std::size_t limit) override;
  std::vector<model::ExecutionRecord> ListOpenExecutions(Transaction&) override;

  Result AppendEvents(Transaction&, const std::string& workflow_id, const std::string& run_id, int64_t expected_seq,
                      std::vector<model::EventRecord>& events) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const std::string& workflow_id, const std::string& run_id,
                                             int64_t from_seq) override;
  int64_t CountEvents(Transaction&, const std::string& workflow_id, const std::string& run_id) override;

  Result InsertInbox(Transaction&, model::InboxRecord& record) override;
  std::vector<model::InboxRecord> ListInbox(Transaction&, const std::string& workflow_id,
                                            const std::string& run_id) override;
  Result DeleteInbox(Transaction&, uint64_t id) override;

  std::optional<model::RunLockRecord> GetRunLock(Transaction&, const std::string& workflow_id,
                                                 const std::string& run_id) override;
  Result UpsertRunLock(Transaction&, const model::RunLockRecord&) override;
  Result DeleteRunLock(Transaction&, const std::string& workflow_id, const std::string& run_id) override;

  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& task_id) override;
  Result UpdateTask(Transaction&, const model::TaskRecord&) override;
  Result DeleteTask(Transaction&, const std::string& task_id) override;
  std::vector<model::TaskRecord> ListVisibleTasks(Transaction&, const std::string& task_queue, uint64_t now_ms,
                                                  std::size_t limit) override;
  std::vector<model::TaskRecord> ListExpiredTasks(Transaction&, uint64_t now_ms) override;
  std::vector<model::TaskRecord> ListTasksForRun(Transaction&, const std::string& workflow_id,
                                                 const std::string& run_id) override;

  Result InsertTimer(Transaction&, const model::TimerRecord&) override;
  std::vector<model::TimerRecord> ListDueTimers(Transaction&, uint64_t now_ms) override;
  std::vector<model::TimerRecord> ListTimersForRun(Transaction&, const std::string& workflow_id,
                                                   const std::string& run_id) override;
  Result DeleteTimer(Transaction&, const std::string& workflow_id, const std::string& run_id,
                     int64_t command_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::ExecutionRecord>                     executions;
    std::unordered_map<std::string, std::vector<model::EventRecord>> events;
    std::map<uint64_t, model::InboxRecord>                            inbox;
    uint64_t                                                          next_inbox_id = 1;
    std::unordered_map<std::string, model::RunLockRecord>            run_locks;
    std::map<std::string, model::TaskRecord>                          tasks;
    std::map<std::string, model::TimerRecord>                         timers;
  };

  // held by a MemoryTransaction for its whole lifetime
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
