#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "flowstead/history/v1/history.pb.h"
#include "internal/util/time.hpp"

namespace flowstead::workflow {

/*
  Control-flow signals thrown through workflow code. They do not derive
  from std::exception so `catch (const std::exception&)` in a workflow
  never intercepts them.
*/

// The workflow needs a result that history does not hold yet.
struct SuspendExecution {};

struct ContinueAsNewRequest {
  std::string input;
};

struct ActivityOptions {
  std::string                      task_queue; // empty: the workflow's own queue
  util::Millis                     start_to_close{0};
  util::Millis                     schedule_to_start{0};
  flowstead::core::v1::RetryPolicy retry_policy;
  std::string                      activity_id; // empty: the command id
};

struct ActivityHandle {
  int64_t     command_id = 0;
  std::string activity_type;
};

struct TimerHandle {
  int64_t command_id = 0;
};

struct ChildSpec {
  std::string  workflow_type;
  std::string  input;
  std::string  workflow_id; // empty: "<parent workflow id>/child-<command id>"
  std::string  task_queue;  // empty: the parent's queue
  util::Millis run_timeout{0};
};

struct ChildHandle {
  int64_t                                   command_id = 0;
  flowstead::core::v1::WorkflowExecutionKey execution;
  std::string                               workflow_type;
};

struct ChildOutcome {
  bool                                ok = false;
  std::string                         result;
  flowstead::core::v1::Failure        failure;
  flowstead::core::v1::WorkflowStatus status = flowstead::core::v1::WORKFLOW_STATUS_UNSPECIFIED;
};

// Outcomes in fan-out order, regardless of completion order.
struct JoinResult {
  std::vector<ChildOutcome> outcomes;
};

struct WorkflowInfo {
  flowstead::core::v1::WorkflowExecutionKey execution;
  std::string                               workflow_type;
  std::string                               task_queue;
  flowstead::core::v1::WorkflowExecutionKey parent;
  std::string                               continued_from_run_id;
};

using IdGenerator = std::function<std::string()>;

/*
  WorkflowContext

  The only handle workflow code gets. Every operation is assigned a
  command id in program order. When history already holds the command,
  the recorded identity is checked and its recorded outcome is returned;
  otherwise a new decision is emitted and, if the code needs the result,
  execution suspends.

  Now() and TryReceiveSignal() depend on the logical position: the
  highest seq among the events the code has consumed so far
  (WorkflowStarted at first). Both are therefore identical on every
  replay of the same history.
*/
class WorkflowContext {
 public:
  // history[0] must be WorkflowStarted. `now` stamps new decisions.
  WorkflowContext(flowstead::core::v1::WorkflowExecutionKey key, const std::vector<flowstead::history::v1::HistoryEvent>& history,
                  util::TimePoint now, IdGenerator new_id);

  const WorkflowInfo& Info() const {
    return info_;
  }

  ActivityHandle ScheduleActivity(const std::string& activity_type, const std::string& input,
                                  const ActivityOptions& options = {});

  // Returns the result, or throws util::ActivityFailure / util::ActivityTimeoutError.
  std::string Await(const ActivityHandle& handle);

  std::string ExecuteActivity(const std::string& activity_type, const std::string& input, const ActivityOptions& options = {});

  TimerHandle StartTimer(util::Millis duration);
  void        Await(const TimerHandle& handle);
  void        Sleep(util::Millis duration);

  // The next signal named `name` not yet returned by this context.
  std::string                AwaitSignal(const std::string& name);
  std::optional<std::string> TryReceiveSignal(const std::string& name);

  std::vector<ChildHandle> FanOut(const std::vector<ChildSpec>& specs);

  // FAIL_FAST throws util::ChildWorkflowFailure after recording a
  // cancellation request for every sibling that had not finished first.
  JoinResult Join(const std::vector<ChildHandle>& children, flowstead::core::v1::JoinPolicy policy);

  [[noreturn]] void ContinueAsNew(const std::string& input);

  util::TimePoint Now() const;

  // Seeded from the run id.
  uint64_t Random();

  void SetQueryState(const std::string& state) {
    query_state_ = state;
  }

  // Used by the executor once workflow code has returned or suspended.
  std::vector<flowstead::history::v1::HistoryEvent> TakeDecisions() {
    return std::move(decisions_);
  }

  const std::string& QueryState() const {
    return query_state_;
  }

  // Throws util::NonDeterminismError if history holds commands the code
  // never requested, or if a mismatch was detected earlier.
  void VerifyReplayComplete() const;

 private:
  using HistoryEvent = flowstead::history::v1::HistoryEvent;

  // Returns the recorded command for the next id, or nullptr if new.
  const HistoryEvent* NextCommand(int64_t& command_id);

  [[noreturn]] void Diverged(int64_t command_id, const std::string& detail);

  void Emit(HistoryEvent event);

  // Marks an event as consumed by the code.
  void Consume(const HistoryEvent& event);

  const HistoryEvent* OutcomeOf(int64_t command_id) const;

  void RequestChildCancel(const ChildHandle& child);

  flowstead::core::v1::WorkflowExecutionKey key_;
  const std::vector<HistoryEvent>&          history_;
  util::TimePoint                           now_;
  IdGenerator                               new_id_;
  WorkflowInfo                              info_;

  std::map<int64_t, const HistoryEvent*> commands_;
  std::map<int64_t, const HistoryEvent*> outcomes_;
  std::vector<const HistoryEvent*>       signals_;

  int64_t                            next_command_id_ = 1;
  int64_t                            position_        = 0;
  std::set<int64_t>                  replayed_;
  std::map<std::string, std::size_t> signal_cursor_;
  std::vector<HistoryEvent>          decisions_;
  std::string                        query_state_;
  std::mt19937_64                    random_;
  std::optional<std::string>         divergence_;
};

} // namespace flowstead::workflow
