#include "internal/history/events.hpp"

namespace flowstead::history {

using namespace flowstead::history::v1;
using flowstead::core::v1::WorkflowStatus;

HistoryEvent MakeEvent(EventType type, util::TimePoint timestamp) {
  HistoryEvent event;
  event.set_type(type);
  *event.mutable_timestamp() = util::ToProto(timestamp);
  return event;
}

bool IsTerminal(EventType type) {
  switch (type) {
    case EVENT_TYPE_WORKFLOW_COMPLETED:
    case EVENT_TYPE_WORKFLOW_FAILED:
    case EVENT_TYPE_WORKFLOW_CANCELLED:
    case EVENT_TYPE_WORKFLOW_TIMED_OUT:
    case EVENT_TYPE_WORKFLOW_CONTINUED_AS_NEW:
      return true;
    default:
      return false;
  }
}

bool IsCommand(EventType type) {
  switch (type) {
    case EVENT_TYPE_ACTIVITY_SCHEDULED:
    case EVENT_TYPE_TIMER_STARTED:
    case EVENT_TYPE_CHILD_WORKFLOW_STARTED:
    case EVENT_TYPE_CHILD_WORKFLOW_CANCEL_REQUESTED:
      return true;
    default:
      return false;
  }
}

bool IsOutcome(EventType type) {
  switch (type) {
    case EVENT_TYPE_ACTIVITY_COMPLETED:
    case EVENT_TYPE_ACTIVITY_FAILED:
    case EVENT_TYPE_ACTIVITY_TIMED_OUT:
    case EVENT_TYPE_TIMER_FIRED:
    case EVENT_TYPE_CHILD_WORKFLOW_COMPLETED:
    case EVENT_TYPE_CHILD_WORKFLOW_FAILED:
      return true;
    default:
      return false;
  }
}

std::optional<int64_t> CommandIdOf(const HistoryEvent& event) {
  switch (event.attributes_case()) {
    case HistoryEvent::kActivityScheduled:
      return event.activity_scheduled().command_id();
    case HistoryEvent::kActivityCompleted:
      return event.activity_completed().command_id();
    case HistoryEvent::kActivityFailed:
      return event.activity_failed().command_id();
    case HistoryEvent::kActivityTimedOut:
      return event.activity_timed_out().command_id();
    case HistoryEvent::kTimerStarted:
      return event.timer_started().command_id();
    case HistoryEvent::kTimerFired:
      return event.timer_fired().command_id();
    case HistoryEvent::kChildWorkflowStarted:
      return event.child_workflow_started().command_id();
    case HistoryEvent::kChildWorkflowCompleted:
      return event.child_workflow_completed().command_id();
    case HistoryEvent::kChildWorkflowFailed:
      return event.child_workflow_failed().command_id();
    case HistoryEvent::kChildWorkflowCancelRequested:
      return event.child_workflow_cancel_requested().command_id();
    default:
      return std::nullopt;
  }
}

std::string EventTypeName(EventType type) {
  const auto& name = EventType_Name(type);
  // EVENT_TYPE_ACTIVITY_SCHEDULED -> ACTIVITY_SCHEDULED
  constexpr std::string_view kPrefix = "EVENT_TYPE_";
  return name.rfind(kPrefix, 0) == 0 ? name.substr(kPrefix.size()) : name;
}

WorkflowStatus TerminalStatus(EventType type) {
  switch (type) {
    case EVENT_TYPE_WORKFLOW_COMPLETED:
      return flowstead::core::v1::WORKFLOW_STATUS_COMPLETED;
    case EVENT_TYPE_WORKFLOW_FAILED:
      return flowstead::core::v1::WORKFLOW_STATUS_FAILED;
    case EVENT_TYPE_WORKFLOW_CANCELLED:
      return flowstead::core::v1::WORKFLOW_STATUS_CANCELLED;
    case EVENT_TYPE_WORKFLOW_TIMED_OUT:
      return flowstead::core::v1::WORKFLOW_STATUS_TIMED_OUT;
    case EVENT_TYPE_WORKFLOW_CONTINUED_AS_NEW:
      return flowstead::core::v1::WORKFLOW_STATUS_CONTINUED_AS_NEW;
    default:
      return flowstead::core::v1::WORKFLOW_STATUS_RUNNING;
  }
}

std::string StatusName(WorkflowStatus status) {
  const auto& name = flowstead::core::v1::WorkflowStatus_Name(status);
  constexpr std::string_view kPrefix = "WORKFLOW_STATUS_";
  return name.rfind(kPrefix, 0) == 0 ? name.substr(kPrefix.size()) : name;
}

} // namespace flowstead::history
