#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace flowstead::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
