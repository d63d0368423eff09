#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "flowstead/history/v1/history.pb.h"
#include "internal/util/time.hpp"

namespace flowstead::history {

using HistoryEvent = flowstead::history::v1::HistoryEvent;
using EventType    = flowstead::history::v1::EventType;

// Event with type and timestamp set; attributes are filled by the caller.
HistoryEvent MakeEvent(EventType type, util::TimePoint timestamp);

bool IsTerminal(EventType type);

// Decision events carry the id of the command that produced them.
bool IsCommand(EventType type);

// Outcome events resolve an earlier command.
bool IsOutcome(EventType type);

// Command id of a command or outcome event.
std::optional<int64_t> CommandIdOf(const HistoryEvent& event);

std::string EventTypeName(EventType type);

flowstead::core::v1::WorkflowStatus TerminalStatus(EventType type);

std::string StatusName(flowstead::core::v1::WorkflowStatus status);

} // namespace flowstead::history
