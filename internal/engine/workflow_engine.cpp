#include "internal/engine/workflow_engine.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>

#include "internal/history/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/execution_key.hpp"
#include "internal/util/uuid.hpp"

namespace flowstead::engine {

using namespace flowstead::history::v1;
using flowstead::core::v1::WorkflowExecutionKey;
using flowstead::core::v1::WorkflowStatus;
using observability::IntField;
using observability::StringField;

namespace {

constexpr char kDefaultTaskQueue[] = "default";

// Bound on continue-as-new hops followed by WaitForClose.
constexpr int kMaxRunHops = 64;

db::model::ExecutionCursor DecodePageToken(const std::string& token) {
  const auto slash = token.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 == token.size()) {
    throw std::invalid_argument("malformed page token");
  }

  db::model::ExecutionCursor cursor;
  try {
    cursor.start_time_ms = std::stoull(token.substr(0, slash));
  } catch (const std::logic_error&) {
    throw std::invalid_argument("malformed page token");
  }
  cursor.run_id = token.substr(slash + 1);
  return cursor;
}

bool HasEvent(const std::vector<history::InboxEntry>& entries, EventType type) {
  return std::any_of(entries.begin(), entries.end(), [type](const auto& entry) { return entry.event.type() == type; });
}

} // namespace

WorkflowEngine::WorkflowEngine(EngineOptions options, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                               std::shared_ptr<const workflow::WorkflowRegistry> registry)
    : options_(std::move(options)),
      repository_(std::move(repository)),
      clock_(std::move(clock)),
      registry_(std::move(registry)),
      event_log_(std::make_shared<history::EventLog>(repository_)),
      inbox_(std::make_shared<history::Inbox>(repository_)),
      executions_(std::make_shared<history::ExecutionStore>(repository_, event_log_)),
      run_locks_(std::make_shared<lease::RunLockManager>(repository_, clock_)),
      task_queue_(std::make_shared<queue::TaskQueue>(repository_, clock_)),
      activities_(std::make_shared<activity::ActivityScheduler>(repository_, task_queue_, inbox_, clock_,
                                                                options_.default_start_to_close)),
      timers_(std::make_shared<timer::TimerService>(repository_, inbox_, clock_)),
      children_(std::make_shared<orchestrator::ChildCoordinator>(repository_, executions_, inbox_, registry_)),
      executor_(registry_),
      decisions_(clock_) {
  if (options_.instance_id.empty()) {
    options_.instance_id = util::NewId();
  }
  if (options_.decision_threads < 1) {
    options_.decision_threads = 1;
  }

  auto wake = [this](const WorkflowExecutionKey& key) { ScheduleDecision(key); };
  activities_->SetWakeCallback(wake);
  timers_->SetWakeCallback(wake);
}

WorkflowEngine::~WorkflowEngine() {
  Stop();
}

void WorkflowEngine::Start() {
  if (running_.exchange(true)) return;

  const auto recovered = RecoverOpenRuns();
  FLOWSTEAD_LOG_INFO("Workflow engine started", {StringField("instance_id", options_.instance_id),
                                                 IntField("decision_threads", options_.decision_threads),
                                                 IntField("recovered_runs", static_cast<int64_t>(recovered))});

  for (int i = 0; i < options_.decision_threads; ++i) {
    decision_threads_.emplace_back(&WorkflowEngine::DecisionLoop, this);
  }
  sweeper_ = std::thread(&WorkflowEngine::SweepLoop, this);
}

void WorkflowEngine::Stop() {
  if (!running_.exchange(false)) return;

  decisions_.Shutdown();
  task_queue_->Shutdown();
  sweep_cv_.notify_all();

  for (auto& thread : decision_threads_) {
    if (thread.joinable()) thread.join();
  }
  decision_threads_.clear();
  if (sweeper_.joinable()) sweeper_.join();

  FLOWSTEAD_LOG_INFO("Workflow engine stopped", {StringField("instance_id", options_.instance_id)});
}

// ------------------------------------------------------------------
// Client operations
// ------------------------------------------------------------------

WorkflowExecutionKey WorkflowEngine::StartWorkflow(const StartRequest& request) {
  if (request.workflow_type.empty()) {
    throw std::invalid_argument("workflow_type is required");
  }
  if (!registry_->Contains(request.workflow_type)) {
    throw util::NotFound("workflow type not registered: " + request.workflow_type);
  }

  history::NewRun run;
  run.key           = util::MakeKey(request.workflow_id.empty() ? util::NewId() : request.workflow_id, util::NewId());
  run.workflow_type = request.workflow_type;
  run.task_queue    = request.task_queue.empty() ? kDefaultTaskQueue : request.task_queue;
  run.input         = request.input;
  run.run_timeout   = request.run_timeout;

  auto tx = repository_->Begin();
  executions_->Create(*tx, run, clock_->Now());
  tx->Commit();

  FLOWSTEAD_LOG_INFO("Workflow started", {StringField("execution", util::KeyString(run.key)),
                                          StringField("workflow_type", run.workflow_type),
                                          StringField("task_queue", run.task_queue)});
  ScheduleDecision(run.key);
  return run.key;
}

void WorkflowEngine::PostToInbox(const WorkflowExecutionKey& key, HistoryEvent event) {
  auto tx     = repository_->Begin();
  auto record = executions_->Require(*tx, key);
  if (record.status != flowstead::core::v1::WORKFLOW_STATUS_RUNNING) {
    tx->Rollback();
    throw util::InvalidState("workflow " + util::KeyString(util::MakeKey(record.workflow_id, record.run_id)) + " is " +
                             history::StatusName(record.status));
  }

  const auto resolved = util::MakeKey(record.workflow_id, record.run_id);
  inbox_->Post(*tx, resolved, event);
  tx->Commit();
  ScheduleDecision(resolved);
}

void WorkflowEngine::Signal(const WorkflowExecutionKey& key, const std::string& name, const std::string& payload) {
  if (name.empty()) {
    throw std::invalid_argument("signal name is required");
  }

  auto  event = history::MakeEvent(EVENT_TYPE_SIGNAL_RECEIVED, clock_->Now());
  auto* attrs = event.mutable_signal_received();
  attrs->set_name(name);
  attrs->set_payload(payload);
  PostToInbox(key, std::move(event));
}

void WorkflowEngine::Cancel(const WorkflowExecutionKey& key, const std::string& reason) {
  auto event = history::MakeEvent(EVENT_TYPE_CANCEL_REQUESTED, clock_->Now());
  event.mutable_cancel_requested()->set_reason(reason);
  PostToInbox(key, std::move(event));
  FLOWSTEAD_LOG_INFO("Workflow cancellation requested", {StringField("workflow_id", key.workflow_id())});
}

db::model::ExecutionRecord WorkflowEngine::Describe(const WorkflowExecutionKey& key) {
  auto tx     = repository_->Begin();
  auto record = executions_->Require(*tx, key);
  tx->Commit();
  return record;
}

db::model::ExecutionRecord WorkflowEngine::WaitForClose(const WorkflowExecutionKey& key, util::Millis timeout) {
  const bool has_deadline = timeout.count() > 0;
  const auto deadline     = std::chrono::steady_clock::now() + timeout;

  auto current = key;
  for (int hops = 0;;) {
    uint64_t generation = 0;
    {
      std::lock_guard lock(close_mutex_);
      generation = close_generation_;
    }

    auto record = Describe(current);
    if (record.status == flowstead::core::v1::WORKFLOW_STATUS_CONTINUED_AS_NEW && !record.continued_as_run_id.empty() &&
        hops < kMaxRunHops) {
      current = util::MakeKey(record.workflow_id, record.continued_as_run_id);
      ++hops;
      continue;
    }
    if (record.status != flowstead::core::v1::WORKFLOW_STATUS_RUNNING) {
      return record;
    }
    current = util::MakeKey(record.workflow_id, record.run_id);

    std::unique_lock lock(close_mutex_);
    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      throw util::DeadlineExceeded("workflow " + util::KeyString(current) + " still running after " +
                                   std::to_string(timeout.count()) + "ms");
    }
    // Closes committed by another engine instance are only seen by polling.
    auto slice = std::chrono::steady_clock::duration(std::chrono::milliseconds(200));
    if (has_deadline) slice = std::min(slice, deadline - std::chrono::steady_clock::now());
    close_cv_.wait_for(lock, slice, [&] { return close_generation_ != generation; });
  }
}

QuerySnapshot WorkflowEngine::Query(const WorkflowExecutionKey& key) {
  QuerySnapshot snapshot;

  auto tx            = repository_->Begin();
  snapshot.execution = executions_->Require(*tx, key);
  const auto resolved = util::MakeKey(snapshot.execution.workflow_id, snapshot.execution.run_id);
  const auto history  = event_log_->ReadInTransaction(*tx, resolved);
  const auto inbox    = inbox_->List(*tx, resolved);
  tx->Commit();

  snapshot.pending          = workflow::FindPendingWork(history);
  snapshot.cancel_requested = HasEvent(inbox, EVENT_TYPE_CANCEL_REQUESTED) ||
                              std::any_of(history.begin(), history.end(),
                                          [](const auto& event) { return event.type() == EVENT_TYPE_CANCEL_REQUESTED; });

  if (snapshot.execution.halted) {
    return snapshot;
  }
  try {
    auto replayed = executor_.Execute(resolved, history, clock_->Now(), [] { return std::string(); }, workflow::ExecuteMode::kQuery);
    snapshot.query_state = std::move(replayed.query_state);
  } catch (const util::NonDeterminismError& e) {
    FLOWSTEAD_LOG_WARN("Query replay diverged", {StringField("execution", util::KeyString(resolved)), StringField("error", e.what())});
  }
  return snapshot;
}

std::vector<HistoryEvent> WorkflowEngine::GetHistory(const WorkflowExecutionKey& key) {
  auto tx       = repository_->Begin();
  auto record   = executions_->Require(*tx, key);
  auto events   = event_log_->ReadInTransaction(*tx, util::MakeKey(record.workflow_id, record.run_id));
  tx->Commit();
  return events;
}

ListPage WorkflowEngine::ListWorkflows(const db::model::ExecutionFilter& filter, const std::string& page_token, std::size_t page_size) {
  std::optional<db::model::ExecutionCursor> after;
  if (!page_token.empty()) after = DecodePageToken(page_token);
  if (page_size == 0) page_size = 100;

  auto tx   = repository_->Begin();
  auto rows = repository_->ListExecutions(*tx, filter, after, page_size + 1);
  tx->Commit();

  ListPage page;
  if (rows.size() > page_size) {
    rows.resize(page_size);
    page.next_page_token = PageTokenAfter(rows.back());
  }
  page.executions = std::move(rows);
  return page;
}

std::string WorkflowEngine::PageTokenAfter(const db::model::ExecutionRecord& last) {
  return std::to_string(last.start_time_ms) + "/" + last.run_id;
}

void WorkflowEngine::ResumeHalted(const WorkflowExecutionKey& key) {
  auto tx     = repository_->Begin();
  auto record = executions_->Require(*tx, key);
  if (!record.halted) {
    tx->Rollback();
    throw util::InvalidState("workflow " + record.workflow_id + "/" + record.run_id + " is not halted");
  }

  record.halted = false;
  record.halt_reason.clear();
  executions_->Save(*tx, record);
  tx->Commit();

  const auto resolved = util::MakeKey(record.workflow_id, record.run_id);
  FLOWSTEAD_LOG_INFO("Halted workflow resumed", {StringField("execution", util::KeyString(resolved))});
  ScheduleDecision(resolved);
}

// ------------------------------------------------------------------
// Decision cycles
// ------------------------------------------------------------------

void WorkflowEngine::ScheduleDecision(const WorkflowExecutionKey& key, util::TimePoint not_before) {
  decisions_.Push(key, not_before);
}

void WorkflowEngine::RunQueuedCycle(const WorkflowExecutionKey& key) {
  try {
    RunDecisionCycle(key);
  } catch (const std::exception& e) {
    FLOWSTEAD_LOG_ERROR("Decision cycle aborted; retrying", {StringField("execution", util::KeyString(key)), StringField("error", e.what())});
    RetryLater(key);
  }
  decisions_.Done(key);
}

void WorkflowEngine::RunDecisionCycle(const WorkflowExecutionKey& key) {
  lease::AcquireResult acquired = lease::AcquireResult::kAlreadyHeld;
  try {
    acquired = run_locks_->Acquire(key, options_.instance_id, options_.run_lock_ttl);
  } catch (const std::exception& e) {
    FLOWSTEAD_LOG_WARN("Run lock acquire failed; retrying", {StringField("execution", util::KeyString(key)), StringField("error", e.what())});
    RetryLater(key);
    return;
  }
  if (acquired == lease::AcquireResult::kAlreadyHeld) {
    FLOWSTEAD_LOG_DEBUG("Run locked elsewhere; deferring", {StringField("execution", util::KeyString(key))});
    ScheduleDecision(key, clock_->Now() + options_.retry_initial);
    return;
  }

  observability::SpanScope span("flowstead.decision_cycle");
  span.SetAttribute("workflow_id", key.workflow_id());
  span.SetAttribute("run_id", key.run_id());
  const auto started = std::chrono::steady_clock::now();

  CycleEffects effects;
  try {
    effects = Decide(key);
  } catch (const util::NonDeterminismError& e) {
    span.RecordException(e.what());
    ReleaseLock(key);
    Halt(key, e.what());
    return;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    ReleaseLock(key);
    FLOWSTEAD_LOG_WARN("Decision cycle failed; retrying", {StringField("execution", util::KeyString(key)), StringField("error", e.what())});
    RetryLater(key);
    return;
  }
  ReleaseLock(key);

  {
    std::lock_guard lock(retry_mutex_);
    consecutive_failures_.erase(util::KeyString(key));
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  if (!effects.workflow_type.empty()) {
    observability::Metrics::Instance().ObserveDecisionLatencyMs(effects.workflow_type, elapsed);
  }
  ApplyEffects(effects);
}

WorkflowEngine::CycleEffects WorkflowEngine::Decide(const WorkflowExecutionKey& key) {
  CycleEffects effects;
  auto         tx  = repository_->Begin();
  const auto   now = clock_->Now();

  auto record = repository_->GetExecution(*tx, key.workflow_id(), key.run_id());
  if (!record) {
    tx->Rollback();
    return effects;
  }

  auto entries = inbox_->List(*tx, key);
  if (record->status != flowstead::core::v1::WORKFLOW_STATUS_RUNNING) {
    // Late arrivals for a closed run have nothing left to resume.
    for (const auto& entry : entries) inbox_->Remove(*tx, entry.id);
    tx->Commit();
    return effects;
  }
  if (record->halted) {
    tx->Rollback();
    return effects;
  }
  effects.workflow_type = record->workflow_type;

  auto          history      = event_log_->ReadInTransaction(*tx, key);
  const int64_t expected_seq = static_cast<int64_t>(history.size());

  std::set<int64_t> resolved;
  for (const auto& event : history) {
    if (history::IsOutcome(event.type())) resolved.insert(*history::CommandIdOf(event));
  }

  // Inbox entries become history in arrival order. Redelivered outcomes
  // for an already resolved command are dropped.
  std::vector<HistoryEvent>   appended;
  std::optional<HistoryEvent> timed_out;
  for (const auto& entry : entries) {
    const auto& event = entry.event;
    if (event.type() == EVENT_TYPE_WORKFLOW_TIMED_OUT) {
      if (!timed_out) timed_out = event;
      continue;
    }
    if (history::IsOutcome(event.type()) && !resolved.insert(*history::CommandIdOf(event)).second) {
      continue;
    }

    auto copy = event;
    copy.set_seq(static_cast<int64_t>(history.size()));
    history.push_back(copy);
    appended.push_back(std::move(copy));
  }

  std::vector<HistoryEvent> decisions;
  if (timed_out) {
    decisions.push_back(*timed_out);
  } else {
    auto result = executor_.Execute(key, history, now, [] { return util::NewId(); });
    decisions   = std::move(result.decisions);
  }

  std::optional<HistoryEvent> terminal;
  for (auto& decision : decisions) {
    switch (decision.type()) {
      case EVENT_TYPE_ACTIVITY_SCHEDULED: {
        auto task = activities_->Schedule(*tx, key, decision.activity_scheduled());
        effects.task_queues.push_back(task.task_queue());
        break;
      }
      case EVENT_TYPE_TIMER_STARTED:
        timers_->Schedule(*tx, key, decision.timer_started());
        break;
      case EVENT_TYPE_CHILD_WORKFLOW_STARTED: {
        auto failed = children_->StartChild(*tx, key, decision.child_workflow_started(), now);
        appended.push_back(decision);
        if (failed) {
          // The outcome is already history; the run needs another cycle to see it.
          appended.push_back(std::move(*failed));
          effects.wake.push_back(key);
        } else {
          effects.wake.push_back(decision.child_workflow_started().child());
        }
        continue;
      }
      case EVENT_TYPE_CHILD_WORKFLOW_CANCEL_REQUESTED: {
        const auto& attrs = decision.child_workflow_cancel_requested();
        if (auto child = children_->RequestCancel(*tx, attrs.child(), "cancelled by parent " + key.workflow_id(), now)) {
          effects.wake.push_back(*child);
        }
        break;
      }
      default:
        if (history::IsTerminal(decision.type())) terminal = decision;
        break;
    }
    appended.push_back(decision);
  }

  history::ExecutionStore::Project(*record, appended);
  executions_->Save(*tx, *record);

  if (terminal) {
    auto full_history = history;
    full_history.insert(full_history.end(), appended.begin() + static_cast<std::ptrdiff_t>(full_history.size() - expected_seq),
                        appended.end());
    CloseRun(*tx, *record, full_history, *terminal, effects);
  }

  if (!run_locks_->Fence(*tx, key, options_.instance_id)) {
    throw util::LeaseLostError("run lock lost before commit: " + util::KeyString(key));
  }

  auto appended_result = event_log_->AppendInTransaction(*tx, key, expected_seq, appended);
  if (appended_result.code == db::ErrorCode::Conflict) {
    throw util::LeaseLostError("history of " + util::KeyString(key) + " advanced concurrently: " + appended_result.message);
  }
  db::ThrowIfError(appended_result, "append history " + util::KeyString(key));

  for (const auto& entry : entries) inbox_->Remove(*tx, entry.id);
  tx->Commit();

  FLOWSTEAD_LOG_DEBUG("Decision cycle committed", {StringField("execution", util::KeyString(key)),
                                                   IntField("appended", static_cast<int64_t>(appended.size())),
                                                   IntField("history_length", record->history_length)});
  return effects;
}

void WorkflowEngine::CloseRun(db::Transaction& tx, db::model::ExecutionRecord& record, const std::vector<HistoryEvent>& full_history,
                              const HistoryEvent& terminal, CycleEffects& effects) {
  const auto key = util::MakeKey(record.workflow_id, record.run_id);
  const auto now = util::FromProto(terminal.timestamp());

  activities_->CancelForRun(tx, key);
  timers_->CancelForRun(tx, key);

  for (const auto& child : workflow::FindPendingWork(full_history).children) {
    if (auto target = children_->RequestCancel(tx, child.child(), "parent " + key.workflow_id() + " closed", now)) {
      effects.wake.push_back(*target);
    }
  }

  if (terminal.type() == EVENT_TYPE_WORKFLOW_CONTINUED_AS_NEW) {
    const auto& started = full_history.front().workflow_started();

    history::NewRun successor;
    successor.key                   = util::MakeKey(record.workflow_id, terminal.workflow_continued_as_new().new_run_id());
    successor.workflow_type         = record.workflow_type;
    successor.task_queue            = record.task_queue;
    successor.input                 = terminal.workflow_continued_as_new().input();
    successor.run_timeout           = util::FromProto(started.run_timeout());
    successor.parent                = started.parent();
    successor.parent_command_id     = started.parent_command_id();
    successor.continued_from_run_id = record.run_id;

    executions_->Create(tx, successor, now);
    effects.wake.push_back(successor.key);
  } else if (auto parent = children_->ReportToParent(tx, record, terminal)) {
    effects.wake.push_back(*parent);
  }

  effects.closed = true;
  effects.status = record.status;

  FLOWSTEAD_LOG_INFO("Workflow closed", {StringField("execution", util::KeyString(key)),
                                         StringField("workflow_type", record.workflow_type),
                                         StringField("status", history::StatusName(record.status))});
}

void WorkflowEngine::ApplyEffects(const CycleEffects& effects) {
  for (const auto& name : effects.task_queues) {
    task_queue_->Notify(name);
  }
  for (const auto& key : effects.wake) {
    ScheduleDecision(key);
  }
  if (effects.closed) {
    observability::Metrics::Instance().RecordWorkflowClosed(effects.workflow_type, history::StatusName(effects.status));
    NotifyClosed();
  }
}

void WorkflowEngine::Halt(const WorkflowExecutionKey& key, const std::string& reason) {
  FLOWSTEAD_LOG_ERROR("Non-determinism detected; halting run", {StringField("execution", util::KeyString(key)),
                                                                StringField("reason", reason)});
  try {
    auto tx     = repository_->Begin();
    auto record = executions_->Require(*tx, key);
    record.halted      = true;
    record.halt_reason = reason;
    executions_->Save(*tx, record);
    tx->Commit();
  } catch (const std::exception& e) {
    FLOWSTEAD_LOG_ERROR("Failed to persist halt; retrying", {StringField("execution", util::KeyString(key)),
                                                            StringField("error", e.what())});
    RetryLater(key);
  }
}

void WorkflowEngine::ReleaseLock(const WorkflowExecutionKey& key) {
  try {
    run_locks_->Release(key, options_.instance_id);
  } catch (const std::exception& e) {
    // The lease still expires on its own.
    FLOWSTEAD_LOG_WARN("Run lock release failed", {StringField("execution", util::KeyString(key)), StringField("error", e.what())});
  }
}

void WorkflowEngine::RetryLater(const WorkflowExecutionKey& key) {
  int failures = 0;
  {
    std::lock_guard lock(retry_mutex_);
    failures = ++consecutive_failures_[util::KeyString(key)];
  }

  auto delay = options_.retry_initial;
  for (int i = 1; i < failures && delay < options_.retry_max; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, options_.retry_max);
  ScheduleDecision(key, clock_->Now() + delay);
}

void WorkflowEngine::NotifyClosed() {
  {
    std::lock_guard lock(close_mutex_);
    ++close_generation_;
  }
  close_cv_.notify_all();
}

// ------------------------------------------------------------------
// Sweeps and recovery
// ------------------------------------------------------------------

SweepStats WorkflowEngine::Sweep() {
  SweepStats stats;
  stats.timers_fired      = timers_->FireDue();
  stats.activity_timeouts = activities_->SweepTimeouts();
  stats.run_timeouts      = EnforceRunTimeouts();
  stats.recovered         = RecoverStalledRuns();
  return stats;
}

std::size_t WorkflowEngine::EnforceRunTimeouts() {
  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  std::vector<WorkflowExecutionKey> expired;
  auto                              tx = repository_->Begin();
  for (const auto& record : repository_->ListOpenExecutions(*tx)) {
    if (record.run_deadline_ms == 0 || record.run_deadline_ms > now_ms) continue;

    const auto key = util::MakeKey(record.workflow_id, record.run_id);
    if (HasEvent(inbox_->List(*tx, key), EVENT_TYPE_WORKFLOW_TIMED_OUT)) continue;

    auto event = history::MakeEvent(EVENT_TYPE_WORKFLOW_TIMED_OUT, now);
    event.mutable_workflow_timed_out();
    inbox_->Post(*tx, key, event);
    expired.push_back(key);
  }
  tx->Commit();

  for (const auto& key : expired) {
    FLOWSTEAD_LOG_INFO("Workflow run timeout elapsed", {StringField("execution", util::KeyString(key))});
    ScheduleDecision(key);
  }
  return expired.size();
}

std::size_t WorkflowEngine::RecoverStalledRuns() {
  std::vector<WorkflowExecutionKey> stalled;

  auto tx = repository_->Begin();
  for (const auto& record : repository_->ListOpenExecutions(*tx)) {
    const auto key = util::MakeKey(record.workflow_id, record.run_id);
    if (record.history_length > 1 && inbox_->List(*tx, key).empty()) continue;
    if (!run_locks_->IsFree(*tx, key)) continue;
    stalled.push_back(key);
  }
  tx->Commit();

  for (const auto& key : stalled) {
    ScheduleDecision(key);
  }
  return stalled.size();
}

std::size_t WorkflowEngine::RecoverOpenRuns() {
  auto tx   = repository_->Begin();
  auto open = repository_->ListOpenExecutions(*tx);
  tx->Commit();

  for (const auto& record : open) {
    ScheduleDecision(util::MakeKey(record.workflow_id, record.run_id));
  }
  return open.size();
}

std::size_t WorkflowEngine::RunUntilIdle(std::size_t max_cycles) {
  std::size_t cycles = 0;
  while (cycles < max_cycles) {
    while (cycles < max_cycles) {
      auto key = decisions_.TryPop();
      if (!key) break;

      RunQueuedCycle(*key);
      ++cycles;
    }

    // Runs requeued only by the recovery scan do not count as new work;
    // otherwise a run that is idle at its first decision would spin here.
    const auto stats = Sweep();
    if (stats.timers_fired + stats.activity_timeouts + stats.run_timeouts == 0) break;
  }
  return cycles;
}

void WorkflowEngine::DecisionLoop() {
  while (running_) {
    auto key = decisions_.Pop();
    if (!key) break;

    RunQueuedCycle(*key);
  }
}

void WorkflowEngine::SweepLoop() {
  while (running_) {
    {
      std::unique_lock lock(sweep_mutex_);
      sweep_cv_.wait_for(lock, options_.sweep_interval, [this] { return !running_; });
    }
    if (!running_) break;

    try {
      Sweep();
    } catch (const std::exception& e) {
      FLOWSTEAD_LOG_ERROR("Engine sweep failed", {StringField("error", e.what())});
    }
  }
}

} // namespace flowstead::engine
