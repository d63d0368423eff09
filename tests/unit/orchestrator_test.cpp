#include "internal/orchestrator/child_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/execution_key.hpp"
#include "tests/support/engine_harness.hpp"

namespace {

using flowstead::testing::EngineHarness;
using flowstead::util::Millis;
using flowstead::workflow::ChildSpec;
using flowstead::workflow::WorkflowContext;
using namespace flowstead::history::v1;
namespace core = flowstead::core::v1;

// Child input: "<ms>" sleeps then succeeds, "fail:<ms>" sleeps then fails.
std::string SleepThenAnswer(WorkflowContext& ctx, const std::string& input) {
  const bool fail = input.rfind("fail:", 0) == 0;
  const auto ms   = std::stoll(fail ? input.substr(5) : input);
  ctx.Sleep(Millis(ms));
  if (fail) throw flowstead::util::WorkflowExecutionError("child gave up after " + std::to_string(ms) + "ms", "ChildBroke");
  return "slept " + std::to_string(ms);
}

// Parent input: policy line, then one child input per line.
std::string FanOutAndJoin(WorkflowContext& ctx, const std::string& input) {
  std::vector<std::string> lines;
  std::size_t              start = 0;
  while (start <= input.size()) {
    const auto end = input.find('\n', start);
    lines.push_back(input.substr(start, end == std::string::npos ? std::string::npos : end - start));
    if (end == std::string::npos) break;
    start = end + 1;
  }

  const auto policy = lines.front() == "fail_fast" ? core::JOIN_POLICY_FAIL_FAST : core::JOIN_POLICY_COLLECT_ALL;

  std::vector<ChildSpec> specs;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    ChildSpec spec;
    spec.workflow_type = "sleeper";
    spec.input         = lines[i];
    specs.push_back(spec);
  }

  auto children = ctx.FanOut(specs);
  auto joined   = ctx.Join(children, policy);

  std::string out;
  for (const auto& outcome : joined.outcomes) {
    if (!out.empty()) out += ",";
    out += outcome.ok ? outcome.result : "error:" + outcome.failure.type();
  }
  return out;
}

void Register(EngineHarness& h) {
  h.workflows->Register("sleeper", SleepThenAnswer);
  h.workflows->Register("fan_out", FanOutAndJoin);
  h.workflows->Register("orphan_parent", [](WorkflowContext& ctx, const std::string&) -> std::string {
    ChildSpec spec;
    spec.workflow_type = "sleeper";
    spec.input         = "60000";
    spec.workflow_id   = "orphan";
    ctx.FanOut({spec});
    throw flowstead::util::WorkflowExecutionError("parent bails out");
  });
  h.workflows->Register("bad_child_type", [](WorkflowContext& ctx, const std::string&) {
    ChildSpec spec;
    spec.workflow_type = "not_registered";
    auto joined        = ctx.Join(ctx.FanOut({spec}), core::JOIN_POLICY_COLLECT_ALL);
    return joined.outcomes[0].failure.type();
  });
}

void TestCollectAllReturnsFanOutOrder() {
  EngineHarness h;
  Register(h);

  auto parent = h.Start("fan_out", "collect_all\n5000\n1000\n3000", "batch");
  h.Settle();

  auto pending = h.engine->Query(parent).pending.children;
  assert(pending.size() == 3);
  assert(pending[0].child().workflow_id() == "batch/child-1");
  assert(pending[2].child().workflow_id() == "batch/child-3");

  h.AdvanceAndSettle(Millis(4000));
  assert(h.Describe(parent).status == core::WORKFLOW_STATUS_RUNNING);
  assert(h.Describe(flowstead::util::MakeKey("batch/child-2", "")).status == core::WORKFLOW_STATUS_COMPLETED);
  assert(h.Describe(flowstead::util::MakeKey("batch/child-3", "")).status == core::WORKFLOW_STATUS_COMPLETED);

  h.AdvanceAndSettle(Millis(1000));
  auto record = h.Describe(parent);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "slept 5000,slept 1000,slept 3000");

  // Child outcomes were recorded in completion order.
  std::vector<std::string> completed;
  for (const auto& event : h.engine->GetHistory(parent)) {
    if (event.type() == EVENT_TYPE_CHILD_WORKFLOW_COMPLETED) completed.push_back(event.child_workflow_completed().child().workflow_id());
  }
  assert((completed == std::vector<std::string>{"batch/child-2", "batch/child-3", "batch/child-1"}));
}

void TestCollectAllKeepsFailures() {
  EngineHarness h;
  Register(h);

  auto parent = h.Start("fan_out", "collect_all\n2000\nfail:1000", "mixed");
  h.Settle();
  h.AdvanceAndSettle(Millis(2000));

  auto record = h.Describe(parent);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "slept 2000,error:ChildBroke");
}

void TestFailFastCancelsSiblings() {
  EngineHarness h;
  Register(h);

  auto parent = h.Start("fan_out", "fail_fast\n5000\nfail:1000\n3000", "race");
  h.Settle();
  h.AdvanceAndSettle(Millis(1000));

  auto record = h.Describe(parent);
  assert(record.status == core::WORKFLOW_STATUS_FAILED);

  core::Failure failure;
  assert(failure.ParseFromString(record.failure));
  assert(failure.kind() == core::FAILURE_KIND_CHILD_WORKFLOW);
  assert(failure.type() == "ChildBroke");

  assert(h.Describe(flowstead::util::MakeKey("race/child-2", "")).status == core::WORKFLOW_STATUS_FAILED);
  assert(h.Describe(flowstead::util::MakeKey("race/child-1", "")).status == core::WORKFLOW_STATUS_CANCELLED);
  assert(h.Describe(flowstead::util::MakeKey("race/child-3", "")).status == core::WORKFLOW_STATUS_CANCELLED);

  int cancel_requests = 0;
  for (const auto& event : h.engine->GetHistory(parent)) {
    if (event.type() == EVENT_TYPE_CHILD_WORKFLOW_CANCEL_REQUESTED) ++cancel_requests;
  }
  assert(cancel_requests == 2);

  // Nothing is left to fire for the cancelled children.
  h.clock->Advance(Millis(10000));
  assert(h.engine->Sweep().timers_fired == 0);
}

void TestClosingParentCancelsOpenChildren() {
  EngineHarness h;
  Register(h);

  auto parent = h.Start("orphan_parent", "");
  h.Settle();

  assert(h.Describe(parent).status == core::WORKFLOW_STATUS_FAILED);
  assert(h.Describe(flowstead::util::MakeKey("orphan", "")).status == core::WORKFLOW_STATUS_CANCELLED);
}

void TestUnknownChildTypeFailsTheChildCommand() {
  EngineHarness h;
  Register(h);

  auto parent = h.Start("bad_child_type", "");
  h.Settle();

  auto record = h.Describe(parent);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "WorkflowTypeNotFound");
}

} // namespace

int main() {
  TestCollectAllReturnsFanOutOrder();
  TestCollectAllKeepsFailures();
  TestFailFastCancelsSiblings();
  TestClosingParentCancelsOpenChildren();
  TestUnknownChildTypeFailsTheChildCommand();

  std::cout << "orchestrator_test: pass\n";
  return 0;
}
