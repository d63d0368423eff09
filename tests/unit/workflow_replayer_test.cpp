#include "internal/workflow/workflow_replayer.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/history/events.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/execution_key.hpp"

namespace {

using flowstead::history::HistoryEvent;
using flowstead::history::MakeEvent;
using flowstead::workflow::ExecutionOutcome;
using flowstead::workflow::WorkflowContext;
using flowstead::workflow::WorkflowRegistry;
using flowstead::workflow::WorkflowReplayer;
using namespace flowstead::history::v1;

const auto kStart = flowstead::util::FromUnixMillis(1700000000000ULL);
const auto kKey   = flowstead::util::MakeKey("shipment-4", "run-1");

std::vector<HistoryEvent> Sequence(std::vector<HistoryEvent> events) {
  for (std::size_t i = 0; i < events.size(); ++i) {
    events[i].set_seq(static_cast<int64_t>(i));
  }
  return events;
}

HistoryEvent Started(const std::string& input) {
  auto event = MakeEvent(EVENT_TYPE_WORKFLOW_STARTED, kStart);
  event.mutable_workflow_started()->set_workflow_type("ship");
  event.mutable_workflow_started()->set_task_queue("default");
  event.mutable_workflow_started()->set_input(input);
  return event;
}

HistoryEvent Scheduled(int64_t id, const std::string& type) {
  auto event = MakeEvent(EVENT_TYPE_ACTIVITY_SCHEDULED, kStart);
  event.mutable_activity_scheduled()->set_command_id(id);
  event.mutable_activity_scheduled()->set_activity_type(type);
  return event;
}

HistoryEvent Completed(int64_t id, const std::string& result) {
  auto event = MakeEvent(EVENT_TYPE_ACTIVITY_COMPLETED, kStart);
  event.mutable_activity_completed()->set_command_id(id);
  event.mutable_activity_completed()->set_result(result);
  return event;
}

HistoryEvent WorkflowDone(const std::string& result) {
  auto event = MakeEvent(EVENT_TYPE_WORKFLOW_COMPLETED, kStart);
  event.mutable_workflow_completed()->set_result(result);
  return event;
}

std::shared_ptr<WorkflowRegistry> Registry(bool label_first) {
  auto registry = std::make_shared<WorkflowRegistry>();
  registry->Register("ship", [label_first](WorkflowContext& ctx, const std::string& input) {
    if (label_first) {
      auto label = ctx.ExecuteActivity("print_label", input);
      return label + "|" + ctx.ExecuteActivity("dispatch", label);
    }
    auto dispatched = ctx.ExecuteActivity("dispatch", input);
    return dispatched + "|" + ctx.ExecuteActivity("print_label", dispatched);
  });
  return registry;
}

std::vector<HistoryEvent> ClosedHistory() {
  return Sequence({Started("box"), Scheduled(1, "print_label"), Completed(1, "L1"), Scheduled(2, "dispatch"),
                   Completed(2, "D1"), WorkflowDone("L1|D1")});
}

void TestClosedHistoryReplaysCleanly() {
  WorkflowReplayer replayer(Registry(true));
  auto             report = replayer.Replay(kKey, ClosedHistory());

  assert(report.outcome == ExecutionOutcome::kCompleted);
  assert(report.result == "L1|D1");
  assert(!report.failure);
  assert(report.pending.empty());
  assert(report.decisions.size() == 3);
  assert(report.decisions[0].activity_scheduled().activity_type() == "print_label");
  assert(report.decisions[2].type() == EVENT_TYPE_WORKFLOW_COMPLETED);
}

void TestChangedCodeIsDetected() {
  WorkflowReplayer replayer(Registry(false));

  bool threw = false;
  try {
    replayer.Replay(kKey, ClosedHistory());
  } catch (const flowstead::util::NonDeterminismError&) {
    threw = true;
  }
  assert(threw);
}

void TestTamperedResultIsDetected() {
  auto history = ClosedHistory();
  history.back().mutable_workflow_completed()->set_result("forged");

  WorkflowReplayer replayer(Registry(true));
  bool             threw = false;
  try {
    replayer.Replay(kKey, history);
  } catch (const flowstead::util::NonDeterminismError& e) {
    threw = std::string(e.what()).find("result differs") != std::string::npos;
  }
  assert(threw);
}

void TestOpenHistoryReportsNextCommands() {
  WorkflowReplayer replayer(Registry(true));
  auto report = replayer.Replay(kKey, Sequence({Started("box"), Scheduled(1, "print_label"), Completed(1, "L1")}));

  assert(report.outcome == ExecutionOutcome::kSuspended);
  assert(report.decisions.size() == 1);
  assert(report.pending.size() == 1);
  assert(report.pending[0].activity_scheduled().activity_type() == "dispatch");
  assert(report.pending[0].activity_scheduled().input() == "L1");
}

void TestCancelledHistoryNeedsNoFurtherCode() {
  auto cancel = MakeEvent(EVENT_TYPE_CANCEL_REQUESTED, kStart);
  cancel.mutable_cancel_requested()->set_reason("customer");
  auto cancelled = MakeEvent(EVENT_TYPE_WORKFLOW_CANCELLED, kStart);
  cancelled.mutable_workflow_cancelled()->set_reason("customer");

  WorkflowReplayer replayer(Registry(true));
  auto report = replayer.Replay(kKey, Sequence({Started("box"), Scheduled(1, "print_label"), cancel, cancelled}));
  assert(report.outcome == ExecutionOutcome::kCancelled);
}

void TestEmptyHistoryIsRejected() {
  WorkflowReplayer replayer(Registry(true));
  bool             threw = false;
  try {
    replayer.Replay(kKey, {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestClosedHistoryReplaysCleanly();
  TestChangedCodeIsDetected();
  TestTamperedResultIsDetected();
  TestOpenHistoryReportsNextCommands();
  TestCancelledHistoryNeedsNoFurtherCode();
  TestEmptyHistoryIsRejected();

  std::cout << "workflow_replayer_test: pass\n";
  return 0;
}
