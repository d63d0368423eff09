#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "flowstead/history/v1/history.pb.h"
#include "internal/activity/activity_scheduler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/decision_queue.hpp"
#include "internal/history/event_log.hpp"
#include "internal/history/execution_store.hpp"
#include "internal/history/inbox.hpp"
#include "internal/lease/run_lock_manager.hpp"
#include "internal/orchestrator/child_coordinator.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/timer/timer_service.hpp"
#include "internal/util/time.hpp"
#include "internal/workflow/workflow_executor.hpp"
#include "internal/workflow/workflow_registry.hpp"

namespace flowstead::engine {

struct EngineOptions {
  std::string  instance_id;
  int          decision_threads = 4;
  util::Millis run_lock_ttl{30000};
  util::Millis sweep_interval{1000};
  util::Millis retry_initial{100};
  util::Millis retry_max{10000};
  util::Millis default_start_to_close{60000};
};

struct StartRequest {
  std::string  workflow_type;
  std::string  input;
  std::string  workflow_id; // empty: generated
  std::string  task_queue;  // empty: "default"
  util::Millis run_timeout{0};
};

struct QuerySnapshot {
  db::model::ExecutionRecord execution;
  workflow::PendingWork      pending;
  std::string                query_state;
  bool                       cancel_requested = false;
};

struct ListPage {
  std::vector<db::model::ExecutionRecord> executions;
  std::string                             next_page_token; // empty on the last page
};

struct SweepStats {
  std::size_t timers_fired      = 0;
  std::size_t activity_timeouts = 0;
  std::size_t run_timeouts      = 0;
  std::size_t recovered         = 0;
};

/*
  WorkflowEngine

  Owns the decision loop. A decision cycle for one run:
    acquire RunLock -> read history + inbox -> replay -> apply side
    effects -> fence -> append (inbox events + decisions) -> commit

  Everything a cycle writes shares one transaction, so a crash at any
  point leaves either the whole cycle or none of it. Runs are driven by
  a pool of decision threads plus a sweeper, or synchronously through
  RunUntilIdle().
*/
class WorkflowEngine {
 public:
  WorkflowEngine(EngineOptions options, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                 std::shared_ptr<const workflow::WorkflowRegistry> registry);
  ~WorkflowEngine();

  WorkflowEngine(const WorkflowEngine&)            = delete;
  WorkflowEngine& operator=(const WorkflowEngine&) = delete;

  void Start();
  void Stop();

  // ---------------------------------------------------------------------
  // Client operations
  // ---------------------------------------------------------------------

  flowstead::core::v1::WorkflowExecutionKey StartWorkflow(const StartRequest& request);

  void Signal(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& name, const std::string& payload);
  void Cancel(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& reason);

  // Empty run_id selects the current run.
  db::model::ExecutionRecord Describe(const flowstead::core::v1::WorkflowExecutionKey& key);

  // Blocks until the run, or the last run of its continue-as-new chain,
  // is closed. timeout <= 0 waits forever; otherwise util::DeadlineExceeded.
  db::model::ExecutionRecord WaitForClose(const flowstead::core::v1::WorkflowExecutionKey& key, util::Millis timeout);

  QuerySnapshot Query(const flowstead::core::v1::WorkflowExecutionKey& key);

  std::vector<flowstead::history::v1::HistoryEvent> GetHistory(const flowstead::core::v1::WorkflowExecutionKey& key);

  ListPage ListWorkflows(const db::model::ExecutionFilter& filter, const std::string& page_token, std::size_t page_size);

  // Opaque token that resumes listing right after `last`.
  static std::string PageTokenAfter(const db::model::ExecutionRecord& last);

  void ResumeHalted(const flowstead::core::v1::WorkflowExecutionKey& key);

  // ---------------------------------------------------------------------
  // Scheduling
  // ---------------------------------------------------------------------

  void ScheduleDecision(const flowstead::core::v1::WorkflowExecutionKey& key, util::TimePoint not_before = {});

  // Runs queued cycles and sweeps on the calling thread until nothing
  // is due. Returns the number of decision cycles run.
  std::size_t RunUntilIdle(std::size_t max_cycles = 100000);

  SweepStats Sweep();

  // Queues every open run that is not halted.
  std::size_t RecoverOpenRuns();

  const std::shared_ptr<queue::TaskQueue>& task_queue() const {
    return task_queue_;
  }
  const std::shared_ptr<activity::ActivityScheduler>& activities() const {
    return activities_;
  }
  const std::shared_ptr<const workflow::WorkflowRegistry>& registry() const {
    return registry_;
  }
  const std::shared_ptr<lease::RunLockManager>& run_locks() const {
    return run_locks_;
  }
  const EngineOptions& options() const {
    return options_;
  }

 private:
  struct CycleEffects {
    std::vector<std::string>                               task_queues;
    std::vector<flowstead::core::v1::WorkflowExecutionKey> wake;
    bool                                                   closed = false;
    std::string                                            workflow_type;
    flowstead::core::v1::WorkflowStatus                    status = flowstead::core::v1::WORKFLOW_STATUS_RUNNING;
  };

  // Runs one cycle for a popped run and marks it done on every path.
  void RunQueuedCycle(const flowstead::core::v1::WorkflowExecutionKey& key);

  void RunDecisionCycle(const flowstead::core::v1::WorkflowExecutionKey& key);

  // The transactional part of a cycle. Caller holds the RunLock.
  CycleEffects Decide(const flowstead::core::v1::WorkflowExecutionKey& key);

  void CloseRun(db::Transaction& tx, db::model::ExecutionRecord& record,
                const std::vector<flowstead::history::v1::HistoryEvent>& full_history,
                const flowstead::history::v1::HistoryEvent& terminal, CycleEffects& effects);

  void Halt(const flowstead::core::v1::WorkflowExecutionKey& key, const std::string& reason);
  void ReleaseLock(const flowstead::core::v1::WorkflowExecutionKey& key);
  void RetryLater(const flowstead::core::v1::WorkflowExecutionKey& key);
  void ApplyEffects(const CycleEffects& effects);

  void PostToInbox(const flowstead::core::v1::WorkflowExecutionKey& key, flowstead::history::v1::HistoryEvent event);

  std::size_t EnforceRunTimeouts();
  std::size_t RecoverStalledRuns();

  void DecisionLoop();
  void SweepLoop();

  void NotifyClosed();

  EngineOptions                                     options_;
  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<util::Clock>                      clock_;
  std::shared_ptr<const workflow::WorkflowRegistry> registry_;

  std::shared_ptr<history::EventLog>             event_log_;
  std::shared_ptr<history::Inbox>                inbox_;
  std::shared_ptr<history::ExecutionStore>       executions_;
  std::shared_ptr<lease::RunLockManager>         run_locks_;
  std::shared_ptr<queue::TaskQueue>              task_queue_;
  std::shared_ptr<activity::ActivityScheduler>   activities_;
  std::shared_ptr<timer::TimerService>           timers_;
  std::shared_ptr<orchestrator::ChildCoordinator> children_;
  workflow::WorkflowExecutor                     executor_;
  DecisionQueue                                  decisions_;

  std::mutex                 retry_mutex_;
  std::map<std::string, int> consecutive_failures_;

  std::mutex              close_mutex_;
  std::condition_variable close_cv_;
  uint64_t                close_generation_ = 0;

  std::atomic<bool>        running_{false};
  std::vector<std::thread> decision_threads_;
  std::thread              sweeper_;
  std::mutex               sweep_mutex_;
  std::condition_variable  sweep_cv_;
};

} // namespace flowstead::engine
