#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/workflow/workflow_registry.hpp"
#include "tests/support/engine_harness.hpp"

namespace {

using flowstead::activity::ActivityContext;
using flowstead::testing::EngineHarness;
using flowstead::util::Millis;
using flowstead::workflow::WorkflowContext;
using namespace flowstead::history::v1;
namespace core = flowstead::core::v1;

constexpr int kSignalsPerEngine = 15;

std::atomic<int> g_charge_calls{0};
std::atomic<int> g_ship_calls{0};

void Register(EngineHarness& h) {
  h.activities->Register("charge", [](const ActivityContext&, const std::string& order) {
    ++g_charge_calls;
    return "charged:" + order;
  });
  h.activities->Register("ship", [](const ActivityContext&, const std::string& receipt) {
    ++g_ship_calls;
    return "shipped:" + receipt;
  });
  h.workflows->Register("order", [](WorkflowContext& ctx, const std::string& input) {
    auto receipt = ctx.ExecuteActivity("charge", input);
    return ctx.ExecuteActivity("ship", receipt);
  });
  h.workflows->Register("reminder", [](WorkflowContext& ctx, const std::string& input) {
    ctx.Sleep(Millis(20000));
    return "remind " + input;
  });
}

void ResetCounters() {
  g_charge_calls = 0;
  g_ship_calls   = 0;
}

int CountEvents(EngineHarness& h, const core::WorkflowExecutionKey& key, EventType type) {
  int n = 0;
  for (const auto& event : h.engine->GetHistory(key)) {
    if (event.type() == type) ++n;
  }
  return n;
}

// Engine A runs the first activity and dies before deciding again. Engine
// B replays the history and never runs that activity a second time.
void TestCompletedActivityIsNotReinvoked() {
  ResetCounters();
  auto          repo = std::make_shared<flowstead::db::memory::MemoryRepository>();
  EngineHarness h(repo, "engine-a");
  Register(h);

  auto key = h.Start("order", "book-17", "order-17");
  h.engine->RunUntilIdle();
  assert(h.worker->ProcessAvailable() == 1);
  assert(g_charge_calls == 1);
  // The outcome sits in the inbox; no engine has decided on it.
  assert(h.Describe(key).status == core::WORKFLOW_STATUS_RUNNING);

  h.Reopen(repo, "engine-b");
  h.Settle();

  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "shipped:charged:book-17");
  assert(g_charge_calls == 1);
  assert(g_ship_calls == 1);
  assert(CountEvents(h, key, EVENT_TYPE_ACTIVITY_SCHEDULED) == 2);
  assert(CountEvents(h, key, EVENT_TYPE_ACTIVITY_COMPLETED) == 2);
}

// A restarted engine reaches the same result a single engine would.
void TestRecoveryMatchesUninterruptedRun() {
  ResetCounters();
  EngineHarness reference;
  Register(reference);
  auto ref_key = reference.Start("order", "lamp", "order-lamp");
  reference.Settle();
  const auto expected = reference.engine->GetHistory(ref_key);

  auto          repo = std::make_shared<flowstead::db::memory::MemoryRepository>();
  EngineHarness h(repo, "engine-a");
  Register(h);
  auto key = h.Start("order", "lamp", "order-lamp");
  h.engine->RunUntilIdle();
  h.Reopen(repo, "engine-b");
  h.Settle();

  const auto recovered = h.engine->GetHistory(key);
  assert(recovered.size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    assert(recovered[i].type() == expected[i].type());
    assert(recovered[i].seq() == expected[i].seq());
  }
  assert(h.Describe(key).result == reference.Describe(ref_key).result);
}

// Engine A crashed while holding the run lock. Engine B waits out the
// lease and takes the run over.
void TestExpiredRunLockIsTakenOver() {
  ResetCounters();
  auto          repo = std::make_shared<flowstead::db::memory::MemoryRepository>();
  EngineHarness h(repo, "engine-a");
  Register(h);

  auto key = h.Start("order", "desk", "order-desk");
  h.engine->RunUntilIdle();
  assert(h.worker->ProcessAvailable() == 1);
  assert(h.engine->run_locks()->Acquire(key, "engine-a", Millis(30000)) == flowstead::lease::AcquireResult::kOk);

  h.Reopen(repo, "engine-b");
  h.Settle();
  assert(h.Describe(key).status == core::WORKFLOW_STATUS_RUNNING);
  assert(h.engine->run_locks()->Inspect(key)->holder_id == "engine-a");

  h.AdvanceAndSettle(Millis(31000));

  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "shipped:charged:desk");
  assert(g_charge_calls == 1);
  assert(!h.engine->run_locks()->Inspect(key).has_value());
}

// Durable timers survive the engine that started them.
void TestTimerFiresAfterRestart() {
  auto          repo = std::make_shared<flowstead::db::memory::MemoryRepository>();
  EngineHarness h(repo, "engine-a");
  Register(h);

  auto key = h.Start("reminder", "dentist", "reminder-1");
  h.Settle();
  h.AdvanceAndSettle(Millis(5000));
  assert(CountEvents(h, key, EVENT_TYPE_TIMER_STARTED) == 1);

  h.Reopen(repo, "engine-b");
  h.AdvanceAndSettle(Millis(10000));
  assert(h.Describe(key).status == core::WORKFLOW_STATUS_RUNNING);

  h.AdvanceAndSettle(Millis(6000));
  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "remind dentist");
  assert(CountEvents(h, key, EVENT_TYPE_TIMER_FIRED) == 1);
}

// A worker that leased a task and vanished: the lease runs out and the
// task is delivered again.
void TestAbandonedActivityIsRedelivered() {
  ResetCounters();
  auto          repo = std::make_shared<flowstead::db::memory::MemoryRepository>();
  EngineHarness h(repo, "engine-a");
  Register(h);

  auto key = h.Start("order", "chair", "order-chair");
  h.engine->RunUntilIdle();

  flowstead::services::v1::PollActivityTaskRequest poll;
  poll.set_worker_id("doomed-worker");
  poll.set_task_queue("default");
  auto leased = h.task_service->PollActivityTask(poll);
  assert(leased.has_task());
  assert(leased.task().attempt() == 1);

  h.Reopen(repo, "engine-b");
  h.Settle();
  assert(g_charge_calls == 0);

  h.AdvanceAndSettle(Millis(65000), Millis(5000));

  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(g_charge_calls == 1);
  assert(CountEvents(h, key, EVENT_TYPE_ACTIVITY_COMPLETED) == 2);
}

// Two live engines share one store and keep deciding the same run, each
// woken by the signals it accepted. The run lock admits one writer at a
// time: history stays gapless and every signal lands exactly once.
void TestTwoEnginesShareOneRun() {
  auto repo      = std::make_shared<flowstead::db::memory::MemoryRepository>();
  auto clock     = std::make_shared<flowstead::util::SystemClock>();
  auto workflows = std::make_shared<flowstead::workflow::WorkflowRegistry>();
  workflows->Register("tally", [](WorkflowContext& ctx, const std::string&) {
    int total = 0;
    for (int i = 0; i < 2 * kSignalsPerEngine; ++i) {
      total += std::stoi(ctx.AwaitSignal("add"));
    }
    return std::to_string(total);
  });

  auto options_for = [](const std::string& instance_id) {
    flowstead::engine::EngineOptions options;
    options.instance_id      = instance_id;
    options.decision_threads = 2;
    options.sweep_interval   = Millis(20);
    options.retry_initial    = Millis(5);
    options.retry_max        = Millis(50);
    return options;
  };
  flowstead::engine::WorkflowEngine a(options_for("engine-a"), repo, clock, workflows);
  flowstead::engine::WorkflowEngine b(options_for("engine-b"), repo, clock, workflows);
  a.Start();
  b.Start();

  flowstead::engine::StartRequest request;
  request.workflow_type = "tally";
  request.workflow_id   = "shared-tally";
  const auto key        = a.StartWorkflow(request);

  std::thread via_a([&] {
    for (int i = 0; i < kSignalsPerEngine; ++i) a.Signal(key, "add", "1");
  });
  std::thread via_b([&] {
    for (int i = 0; i < kSignalsPerEngine; ++i) b.Signal(key, "add", "2");
  });
  via_a.join();
  via_b.join();

  auto closed = b.WaitForClose(key, Millis(30000));
  assert(closed.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(closed.result == std::to_string(kSignalsPerEngine * 1 + kSignalsPerEngine * 2));

  const auto history = a.GetHistory(key);
  int        signals = 0;
  int        started = 0;
  int        done    = 0;
  for (std::size_t i = 0; i < history.size(); ++i) {
    assert(history[i].seq() == static_cast<int64_t>(i + 1));
    if (history[i].type() == EVENT_TYPE_SIGNAL_RECEIVED) ++signals;
    if (history[i].type() == EVENT_TYPE_WORKFLOW_STARTED) ++started;
    if (history[i].type() == EVENT_TYPE_WORKFLOW_COMPLETED) ++done;
  }
  assert(signals == 2 * kSignalsPerEngine);
  assert(started == 1);
  assert(done == 1);
  assert(history.back().type() == EVENT_TYPE_WORKFLOW_COMPLETED);
  assert(closed.history_length == static_cast<int64_t>(history.size()));

  a.Stop();
  b.Stop();
}

} // namespace

int main() {
  TestCompletedActivityIsNotReinvoked();
  TestRecoveryMatchesUninterruptedRun();
  TestExpiredRunLockIsTakenOver();
  TestTimerFiresAfterRestart();
  TestAbandonedActivityIsRedelivered();
  TestTwoEnginesShareOneRun();

  std::cout << "crash_recovery_test: pass\n";
  return 0;
}
