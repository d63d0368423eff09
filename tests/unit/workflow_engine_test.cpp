#include "internal/engine/workflow_engine.hpp"

#include <atomic>
#include <cassert>
#include <cctype>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/execution_key.hpp"
#include "tests/support/engine_harness.hpp"

namespace {

using flowstead::activity::ActivityContext;
using flowstead::testing::EngineHarness;
using flowstead::util::Millis;
using flowstead::workflow::ActivityOptions;
using flowstead::workflow::WorkflowContext;
using namespace flowstead::history::v1;
namespace core = flowstead::core::v1;

std::atomic<bool> g_lowercase_variant{false};
std::atomic<int>  g_flaky_calls{0};

std::string Upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

void RegisterAll(EngineHarness& h) {
  h.activities->Register("upper", [](const ActivityContext&, const std::string& input) { return Upper(input); });
  h.activities->Register("lower", [](const ActivityContext&, const std::string& input) { return input; });
  h.activities->Register("flaky", [](const ActivityContext& ctx, const std::string& input) {
    ++g_flaky_calls;
    if (ctx.Attempt() < 3) throw flowstead::util::TransientActivityError("try again", "Flaky");
    return input + "@" + std::to_string(ctx.Attempt());
  });

  h.workflows->Register("greet", [](WorkflowContext& ctx, const std::string& input) {
    return "hello " + ctx.ExecuteActivity("upper", input);
  });
  h.workflows->Register("approval", [](WorkflowContext& ctx, const std::string&) {
    ctx.SetQueryState("waiting");
    auto who = ctx.AwaitSignal("approve");
    ctx.SetQueryState("approved");
    return "approved by " + who;
  });
  h.workflows->Register("sleepy", [](WorkflowContext& ctx, const std::string&) {
    ctx.Sleep(Millis(10000));
    return std::string("woke");
  });
  h.workflows->Register("countdown", [](WorkflowContext& ctx, const std::string& input) -> std::string {
    const int n = std::stoi(input);
    if (n > 0) ctx.ContinueAsNew(std::to_string(n - 1));
    return "liftoff";
  });
  h.workflows->Register("retrying", [](WorkflowContext& ctx, const std::string& input) {
    ActivityOptions options;
    *options.retry_policy.mutable_initial_interval() = flowstead::util::ToProto(Millis(1000));
    options.retry_policy.set_backoff_coefficient(2.0);
    options.retry_policy.set_maximum_attempts(5);
    return ctx.ExecuteActivity("flaky", input, options);
  });
  h.workflows->Register("toggle", [](WorkflowContext& ctx, const std::string& input) {
    auto result = ctx.ExecuteActivity(g_lowercase_variant ? "lower" : "upper", input);
    ctx.AwaitSignal("go");
    return result;
  });
}

void TestActivityWorkflowCompletes() {
  EngineHarness h;
  RegisterAll(h);

  auto key = h.Start("greet", "ada", "greet-1");
  assert(key.workflow_id() == "greet-1");
  assert(!key.run_id().empty());

  h.Settle();
  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "hello ADA");

  const auto history = h.engine->GetHistory(key);
  assert(history.size() == 4);
  assert(history[0].type() == EVENT_TYPE_WORKFLOW_STARTED);
  assert(history[1].type() == EVENT_TYPE_ACTIVITY_SCHEDULED);
  assert(history[2].type() == EVENT_TYPE_ACTIVITY_COMPLETED);
  assert(history[3].type() == EVENT_TYPE_WORKFLOW_COMPLETED);
  for (std::size_t i = 0; i < history.size(); ++i) {
    assert(history[i].seq() == static_cast<int64_t>(i));
  }
  assert(record.history_length == 4);

  // A closed run is returned without waiting.
  assert(h.engine->WaitForClose(flowstead::util::MakeKey("greet-1", ""), Millis(10)).result == "hello ADA");
}

void TestStartValidation() {
  EngineHarness h;
  RegisterAll(h);

  bool not_found = false;
  try {
    h.Start("unknown", "");
  } catch (const flowstead::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  h.Start("approval", "", "dup");
  bool already = false;
  try {
    h.Start("approval", "", "dup");
  } catch (const flowstead::util::AlreadyExists&) {
    already = true;
  }
  assert(already);
}

void TestSignalAndQuery() {
  EngineHarness h;
  RegisterAll(h);

  auto key = h.Start("approval", "");
  h.Settle();

  auto snapshot = h.engine->Query(key);
  assert(snapshot.execution.status == core::WORKFLOW_STATUS_RUNNING);
  assert(snapshot.query_state == "waiting");
  assert(!snapshot.cancel_requested);

  bool waited = false;
  try {
    h.engine->WaitForClose(key, Millis(20));
  } catch (const flowstead::util::DeadlineExceeded&) {
    waited = true;
  }
  assert(waited);

  h.engine->Signal(key, "approve", "grace");
  h.Settle();

  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "approved by grace");

  bool closed = false;
  try {
    h.engine->Signal(key, "approve", "late");
  } catch (const flowstead::util::InvalidState&) {
    closed = true;
  }
  assert(closed);

  bool missing = false;
  try {
    h.engine->Signal(flowstead::util::MakeKey("nobody", ""), "approve", "x");
  } catch (const flowstead::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestTimerFiresAfterDuration() {
  EngineHarness h;
  RegisterAll(h);

  auto key = h.Start("sleepy", "");
  h.Settle();

  auto snapshot = h.engine->Query(key);
  assert(snapshot.pending.timers.size() == 1);

  h.AdvanceAndSettle(Millis(9000));
  assert(h.Describe(key).status == core::WORKFLOW_STATUS_RUNNING);

  h.AdvanceAndSettle(Millis(1000));
  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "woke");

  const auto history = h.engine->GetHistory(key);
  int        fired   = 0;
  for (const auto& event : history) {
    if (event.type() == EVENT_TYPE_TIMER_FIRED) ++fired;
  }
  assert(fired == 1);
}

void TestCancelClosesRunAndDropsTimers() {
  EngineHarness h;
  RegisterAll(h);

  auto key = h.Start("sleepy", "");
  h.Settle();

  h.engine->Cancel(key, "no longer needed");
  assert(h.engine->Query(key).cancel_requested);
  h.Settle();

  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_CANCELLED);

  h.clock->Advance(Millis(20000));
  assert(h.engine->Sweep().timers_fired == 0);

  bool closed = false;
  try {
    h.engine->Cancel(key, "again");
  } catch (const flowstead::util::InvalidState&) {
    closed = true;
  }
  assert(closed);
}

void TestContinueAsNewChainsRuns() {
  EngineHarness h;
  RegisterAll(h);

  auto first = h.Start("countdown", "2", "rocket");
  h.Settle();

  auto initial = h.Describe(first);
  assert(initial.status == core::WORKFLOW_STATUS_CONTINUED_AS_NEW);
  assert(!initial.continued_as_run_id.empty());

  auto current = h.Describe(flowstead::util::MakeKey("rocket", ""));
  assert(current.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(current.result == "liftoff");
  assert(current.input == "0");
  assert(current.run_id != first.run_id());

  // WaitForClose on the first run follows the chain to its end.
  auto final_record = h.engine->WaitForClose(first, Millis(10));
  assert(final_record.run_id == current.run_id);

  std::set<std::string> runs;
  for (const auto& record : h.engine->ListWorkflows({}, "", 10).executions) {
    if (record.workflow_id == "rocket") runs.insert(record.run_id);
  }
  assert(runs.size() == 3);
}

void TestRunTimeout() {
  EngineHarness h;
  RegisterAll(h);

  flowstead::engine::StartRequest request;
  request.workflow_type = "sleepy";
  request.run_timeout   = Millis(5000);
  auto key              = h.engine->StartWorkflow(request);
  h.Settle();

  h.AdvanceAndSettle(Millis(5000));
  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_TIMED_OUT);

  core::Failure failure;
  assert(failure.ParseFromString(record.failure));
  assert(failure.kind() == core::FAILURE_KIND_TIMEOUT);
  assert(h.engine->GetHistory(key).back().type() == EVENT_TYPE_WORKFLOW_TIMED_OUT);
}

void TestActivityRetriesUntilSuccess() {
  EngineHarness h;
  RegisterAll(h);
  g_flaky_calls = 0;

  auto key = h.Start("retrying", "job");
  h.Settle();
  assert(g_flaky_calls == 1);

  h.AdvanceAndSettle(Millis(1000));
  assert(g_flaky_calls == 2);
  h.AdvanceAndSettle(Millis(2000));
  assert(g_flaky_calls == 3);

  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "job@3");
}

void TestNonDeterminismHaltsUntilResumed() {
  EngineHarness h;
  RegisterAll(h);
  g_lowercase_variant = false;

  auto key = h.Start("toggle", "mixed");
  h.Settle();
  const auto length_before = h.engine->GetHistory(key).size();

  g_lowercase_variant = true;
  h.engine->Signal(key, "go", "");
  h.Settle();

  auto halted = h.Describe(key);
  assert(halted.status == core::WORKFLOW_STATUS_RUNNING);
  assert(halted.halted);
  assert(!halted.halt_reason.empty());
  assert(h.engine->GetHistory(key).size() == length_before);

  // Halted runs are not picked up by recovery.
  h.clock->Advance(Millis(60000));
  h.Settle();
  assert(h.Describe(key).halted);

  g_lowercase_variant = false;
  h.engine->ResumeHalted(key);
  h.Settle();

  auto record = h.Describe(key);
  assert(!record.halted);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "MIXED");

  bool not_halted = false;
  try {
    h.engine->ResumeHalted(key);
  } catch (const flowstead::util::InvalidState&) {
    not_halted = true;
  }
  assert(not_halted);
}

void TestListingPagesAndFilters() {
  EngineHarness h;
  RegisterAll(h);

  for (int i = 0; i < 5; ++i) {
    h.Start(i % 2 == 0 ? "greet" : "approval", "x", "list-" + std::to_string(i));
    h.clock->Advance(Millis(10));
  }
  h.Settle();

  std::vector<std::string> seen;
  std::string              token;
  int                      pages = 0;
  do {
    auto page = h.engine->ListWorkflows({}, token, 2);
    assert(page.executions.size() <= 2);
    for (const auto& record : page.executions) seen.push_back(record.workflow_id);
    token = page.next_page_token;
    ++pages;
  } while (!token.empty());

  assert(pages == 3);
  assert(seen.size() == 5);
  for (int i = 0; i < 5; ++i) {
    assert(seen[i] == "list-" + std::to_string(i));
  }

  flowstead::db::model::ExecutionFilter completed;
  completed.status = core::WORKFLOW_STATUS_COMPLETED;
  assert(h.engine->ListWorkflows(completed, "", 10).executions.size() == 3);

  flowstead::db::model::ExecutionFilter approvals;
  approvals.workflow_type = "approval";
  auto page               = h.engine->ListWorkflows(approvals, "", 10);
  assert(page.executions.size() == 2);
  assert(page.next_page_token.empty());

  bool malformed = false;
  try {
    h.engine->ListWorkflows({}, "garbage", 10);
  } catch (const std::invalid_argument&) {
    malformed = true;
  }
  assert(malformed);
}

} // namespace

int main() {
  TestActivityWorkflowCompletes();
  TestStartValidation();
  TestSignalAndQuery();
  TestTimerFiresAfterDuration();
  TestCancelClosesRunAndDropsTimers();
  TestContinueAsNewChainsRuns();
  TestRunTimeout();
  TestActivityRetriesUntilSuccess();
  TestNonDeterminismHaltsUntilResumed();
  TestListingPagesAndFilters();

  std::cout << "workflow_engine_test: pass\n";
  return 0;
}
