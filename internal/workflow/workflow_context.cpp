#include "internal/workflow/workflow_context.hpp"

#include <stdexcept>

#include "internal/history/events.hpp"
#include "internal/orchestrator/join.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace flowstead::workflow {

using namespace flowstead::history::v1;
using flowstead::core::v1::WorkflowExecutionKey;

WorkflowContext::WorkflowContext(WorkflowExecutionKey key, const std::vector<HistoryEvent>& history, util::TimePoint now,
                                 IdGenerator new_id)
    : key_(std::move(key)), history_(history), now_(now), new_id_(std::move(new_id)), random_(util::SeedFromId(key_.run_id())) {
  if (history_.empty() || history_.front().type() != EVENT_TYPE_WORKFLOW_STARTED) {
    throw std::invalid_argument("history of " + key_.workflow_id() + " does not begin with WorkflowStarted");
  }

  const auto& started         = history_.front().workflow_started();
  info_.execution             = key_;
  info_.workflow_type         = started.workflow_type();
  info_.task_queue            = started.task_queue();
  info_.parent                = started.parent();
  info_.continued_from_run_id = started.continued_from_run_id();
  position_                   = history_.front().seq();

  for (const auto& event : history_) {
    if (event.type() == EVENT_TYPE_SIGNAL_RECEIVED) {
      signals_.push_back(&event);
      continue;
    }

    const auto command_id = history::CommandIdOf(event);
    if (!command_id) continue;
    if (history::IsCommand(event.type())) {
      commands_.emplace(*command_id, &event);
    } else if (history::IsOutcome(event.type())) {
      outcomes_.emplace(*command_id, &event);
    }
  }
}

const HistoryEvent* WorkflowContext::NextCommand(int64_t& command_id) {
  command_id = next_command_id_++;
  auto it    = commands_.find(command_id);
  if (it == commands_.end()) return nullptr;

  replayed_.insert(command_id);
  return it->second;
}

void WorkflowContext::Diverged(int64_t command_id, const std::string& detail) {
  divergence_ = "command " + std::to_string(command_id) + " of " + key_.workflow_id() + ": " + detail;
  throw util::NonDeterminismError(*divergence_);
}

void WorkflowContext::Emit(HistoryEvent event) {
  decisions_.push_back(std::move(event));
}

void WorkflowContext::Consume(const HistoryEvent& event) {
  if (event.seq() > position_) position_ = event.seq();
}

const HistoryEvent* WorkflowContext::OutcomeOf(int64_t command_id) const {
  auto it = outcomes_.find(command_id);
  return it == outcomes_.end() ? nullptr : it->second;
}

ActivityHandle WorkflowContext::ScheduleActivity(const std::string& activity_type, const std::string& input,
                                                 const ActivityOptions& options) {
  int64_t id = 0;
  if (const auto* recorded = NextCommand(id)) {
    if (recorded->type() != EVENT_TYPE_ACTIVITY_SCHEDULED) {
      Diverged(id, "workflow scheduled activity " + activity_type + " but history has " + history::EventTypeName(recorded->type()));
    }
    if (recorded->activity_scheduled().activity_type() != activity_type) {
      Diverged(id, "workflow scheduled activity " + activity_type + " but history has activity " +
                       recorded->activity_scheduled().activity_type());
    }
    return {id, activity_type};
  }

  auto  event = history::MakeEvent(EVENT_TYPE_ACTIVITY_SCHEDULED, now_);
  auto* attrs = event.mutable_activity_scheduled();
  attrs->set_command_id(id);
  attrs->set_activity_id(options.activity_id.empty() ? std::to_string(id) : options.activity_id);
  attrs->set_activity_type(activity_type);
  attrs->set_task_queue(options.task_queue.empty() ? info_.task_queue : options.task_queue);
  attrs->set_input(input);
  *attrs->mutable_retry_policy() = options.retry_policy;
  if (options.start_to_close.count() > 0) {
    *attrs->mutable_start_to_close() = util::ToProto(options.start_to_close);
  }
  if (options.schedule_to_start.count() > 0) {
    *attrs->mutable_schedule_to_start() = util::ToProto(options.schedule_to_start);
  }
  Emit(std::move(event));
  return {id, activity_type};
}

std::string WorkflowContext::Await(const ActivityHandle& handle) {
  const auto* outcome = OutcomeOf(handle.command_id);
  if (!outcome) throw SuspendExecution{};

  Consume(*outcome);
  switch (outcome->type()) {
    case EVENT_TYPE_ACTIVITY_COMPLETED:
      return outcome->activity_completed().result();
    case EVENT_TYPE_ACTIVITY_FAILED:
      throw util::ActivityFailure(outcome->activity_failed().failure());
    case EVENT_TYPE_ACTIVITY_TIMED_OUT:
      throw util::ActivityTimeoutError(outcome->activity_timed_out().failure());
    default:
      Diverged(handle.command_id, "awaited activity " + handle.activity_type + " resolved by " +
                                      history::EventTypeName(outcome->type()));
  }
}

std::string WorkflowContext::ExecuteActivity(const std::string& activity_type, const std::string& input,
                                             const ActivityOptions& options) {
  return Await(ScheduleActivity(activity_type, input, options));
}

TimerHandle WorkflowContext::StartTimer(util::Millis duration) {
  int64_t id = 0;
  if (const auto* recorded = NextCommand(id)) {
    if (recorded->type() != EVENT_TYPE_TIMER_STARTED) {
      Diverged(id, "workflow started a timer but history has " + history::EventTypeName(recorded->type()));
    }
    return {id};
  }

  auto  event = history::MakeEvent(EVENT_TYPE_TIMER_STARTED, now_);
  auto* attrs = event.mutable_timer_started();
  attrs->set_command_id(id);
  attrs->set_timer_id(std::to_string(id));
  *attrs->mutable_duration() = util::ToProto(duration);
  *attrs->mutable_fire_at()  = util::ToProto(now_ + duration);
  Emit(std::move(event));
  return {id};
}

void WorkflowContext::Await(const TimerHandle& handle) {
  const auto* outcome = OutcomeOf(handle.command_id);
  if (!outcome) throw SuspendExecution{};
  if (outcome->type() != EVENT_TYPE_TIMER_FIRED) {
    Diverged(handle.command_id, "awaited timer resolved by " + history::EventTypeName(outcome->type()));
  }
  Consume(*outcome);
}

void WorkflowContext::Sleep(util::Millis duration) {
  Await(StartTimer(duration));
}

std::string WorkflowContext::AwaitSignal(const std::string& name) {
  auto&       cursor = signal_cursor_[name];
  std::size_t seen   = 0;
  for (const auto* signal : signals_) {
    if (signal->signal_received().name() != name) continue;
    if (seen++ < cursor) continue;

    ++cursor;
    Consume(*signal);
    return signal->signal_received().payload();
  }
  throw SuspendExecution{};
}

std::optional<std::string> WorkflowContext::TryReceiveSignal(const std::string& name) {
  auto&       cursor = signal_cursor_[name];
  std::size_t seen   = 0;
  for (const auto* signal : signals_) {
    if (signal->signal_received().name() != name) continue;
    if (seen++ < cursor) continue;

    // Only signals recorded before the current logical position are
    // visible; a later one may not have existed when this code first ran.
    if (signal->seq() >= position_) return std::nullopt;
    ++cursor;
    return signal->signal_received().payload();
  }
  return std::nullopt;
}

std::vector<ChildHandle> WorkflowContext::FanOut(const std::vector<ChildSpec>& specs) {
  std::vector<ChildHandle> handles;
  handles.reserve(specs.size());

  for (const auto& spec : specs) {
    int64_t     id          = 0;
    const auto* recorded    = NextCommand(id);
    const auto  workflow_id = spec.workflow_id.empty() ? key_.workflow_id() + "/child-" + std::to_string(id) : spec.workflow_id;

    if (recorded) {
      if (recorded->type() != EVENT_TYPE_CHILD_WORKFLOW_STARTED) {
        Diverged(id, "workflow started child " + spec.workflow_type + " but history has " +
                         history::EventTypeName(recorded->type()));
      }
      const auto& started = recorded->child_workflow_started();
      if (started.workflow_type() != spec.workflow_type || started.child().workflow_id() != workflow_id) {
        Diverged(id, "workflow started child " + spec.workflow_type + "(" + workflow_id + ") but history has " +
                         started.workflow_type() + "(" + started.child().workflow_id() + ")");
      }
      handles.push_back({id, started.child(), spec.workflow_type});
      continue;
    }

    WorkflowExecutionKey child;
    child.set_workflow_id(workflow_id);
    child.set_run_id(new_id_());

    auto  event = history::MakeEvent(EVENT_TYPE_CHILD_WORKFLOW_STARTED, now_);
    auto* attrs = event.mutable_child_workflow_started();
    attrs->set_command_id(id);
    *attrs->mutable_child() = child;
    attrs->set_workflow_type(spec.workflow_type);
    attrs->set_input(spec.input);
    attrs->set_task_queue(spec.task_queue.empty() ? info_.task_queue : spec.task_queue);
    if (spec.run_timeout.count() > 0) {
      *attrs->mutable_run_timeout() = util::ToProto(spec.run_timeout);
    }
    Emit(std::move(event));
    handles.push_back({id, child, spec.workflow_type});
  }
  return handles;
}

void WorkflowContext::RequestChildCancel(const ChildHandle& child) {
  int64_t id = 0;
  if (const auto* recorded = NextCommand(id)) {
    if (recorded->type() != EVENT_TYPE_CHILD_WORKFLOW_CANCEL_REQUESTED ||
        recorded->child_workflow_cancel_requested().child_command_id() != child.command_id) {
      Diverged(id, "workflow requested cancellation of child command " + std::to_string(child.command_id) +
                       " but history has " + history::EventTypeName(recorded->type()));
    }
    return;
  }

  auto  event = history::MakeEvent(EVENT_TYPE_CHILD_WORKFLOW_CANCEL_REQUESTED, now_);
  auto* attrs = event.mutable_child_workflow_cancel_requested();
  attrs->set_command_id(id);
  attrs->set_child_command_id(child.command_id);
  *attrs->mutable_child() = child.execution;
  Emit(std::move(event));
}

JoinResult WorkflowContext::Join(const std::vector<ChildHandle>& children, flowstead::core::v1::JoinPolicy policy) {
  std::vector<orchestrator::ChildState> states;
  states.reserve(children.size());
  for (const auto& child : children) {
    orchestrator::ChildState state;
    if (const auto* outcome = OutcomeOf(child.command_id)) {
      state.resolved    = true;
      state.failed      = outcome->type() == EVENT_TYPE_CHILD_WORKFLOW_FAILED;
      state.outcome_seq = outcome->seq();
    }
    states.push_back(state);
  }

  const auto decision = orchestrator::EvaluateJoin(policy, states);
  if (!decision.ready) throw SuspendExecution{};

  if (decision.failed_index) {
    for (auto index : decision.cancel) {
      RequestChildCancel(children[index]);
    }
    const auto* failed = OutcomeOf(children[*decision.failed_index].command_id);
    Consume(*failed);
    throw util::ChildWorkflowFailure(*decision.failed_index, failed->child_workflow_failed().failure());
  }

  JoinResult result;
  result.outcomes.reserve(children.size());
  for (const auto& child : children) {
    const auto* outcome = OutcomeOf(child.command_id);
    Consume(*outcome);

    ChildOutcome out;
    if (outcome->type() == EVENT_TYPE_CHILD_WORKFLOW_COMPLETED) {
      out.ok     = true;
      out.result = outcome->child_workflow_completed().result();
      out.status = flowstead::core::v1::WORKFLOW_STATUS_COMPLETED;
    } else if (outcome->type() == EVENT_TYPE_CHILD_WORKFLOW_FAILED) {
      out.failure = outcome->child_workflow_failed().failure();
      out.status  = outcome->child_workflow_failed().status();
    } else {
      Diverged(child.command_id, "child " + child.execution.workflow_id() + " resolved by " +
                                     history::EventTypeName(outcome->type()));
    }
    result.outcomes.push_back(std::move(out));
  }
  return result;
}

void WorkflowContext::ContinueAsNew(const std::string& input) {
  throw ContinueAsNewRequest{input};
}

util::TimePoint WorkflowContext::Now() const {
  const auto index = static_cast<std::size_t>(position_);
  if (index < history_.size() && history_[index].seq() == position_) {
    return util::FromProto(history_[index].timestamp());
  }
  for (const auto& event : history_) {
    if (event.seq() == position_) return util::FromProto(event.timestamp());
  }
  return util::FromProto(history_.front().timestamp());
}

uint64_t WorkflowContext::Random() {
  return random_();
}

void WorkflowContext::VerifyReplayComplete() const {
  if (divergence_) {
    throw util::NonDeterminismError(*divergence_);
  }
  for (const auto& [id, event] : commands_) {
    if (replayed_.count(id) == 0) {
      throw util::NonDeterminismError("history of " + key_.workflow_id() + " records " + history::EventTypeName(event->type()) +
                                      " as command " + std::to_string(id) + " but the workflow never requested it");
    }
  }
}

} // namespace flowstead::workflow
