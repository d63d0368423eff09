#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace flowstead::db::memory {

namespace {

std::string RunKey(const std::string& workflow_id, const std::string& run_id) {
  return workflow_id + "#" + run_id;
}

std::string TimerKey(const std::string& workflow_id, const std::string& run_id, int64_t command_id) {
  return RunKey(workflow_id, run_id) + "#" + std::to_string(command_id);
}

bool Matches(const model::ExecutionRecord& r, const model::ExecutionFilter& filter) {
  if (filter.status && r.status != *filter.status) return false;
  if (filter.workflow_type && r.workflow_type != *filter.workflow_type) return false;
  return true;
}

bool IsAfter(const model::ExecutionRecord& r, const model::ExecutionCursor& cursor) {
  return std::tie(r.start_time_ms, r.run_id) > std::tie(cursor.start_time_ms, cursor.run_id);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result MemoryRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = RunKey(r.workflow_id, r.run_id);
  if (s.executions.contains(key)) return Result::Err(ErrorCode::AlreadyExists, key);
  s.executions[key] = r;
  return Result::Ok();
}

std::optional<model::ExecutionRecord> MemoryRepository::GetExecution(Transaction& t, const std::string& workflow_id,
                                                                     const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.executions.find(RunKey(workflow_id, run_id));
  if (it == s.executions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ExecutionRecord> MemoryRepository::GetCurrentExecution(Transaction& t, const std::string& workflow_id) {
  for (const auto& [_, r] : TX(t).View().executions) {
    if (r.workflow_id == workflow_id && r.is_current) return r;
  }
  return std::nullopt;
}

Result MemoryRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.executions.find(RunKey(r.workflow_id, r.run_id));
  if (it == s.executions.end()) return Result::Err(ErrorCode::NotFound);
  it->second = r;
  return Result::Ok();
}

std::vector<model::ExecutionRecord> MemoryRepository::ListExecutions(Transaction& t, const model::ExecutionFilter& filter,
                                                                     const std::optional<model::ExecutionCursor>& after,
                                                                     std::size_t limit) {
  std::vector<model::ExecutionRecord> out;
  for (const auto& [_, r] : TX(t).View().executions) {
    if (!Matches(r, filter)) continue;
    if (after && !IsAfter(r, *after)) continue;
    out.push_back(r);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.start_time_ms, a.run_id) < std::tie(b.start_time_ms, b.run_id);
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::ExecutionRecord> MemoryRepository::ListOpenExecutions(Transaction& t) {
  std::vector<model::ExecutionRecord> out;
  for (const auto& [_, r] : TX(t).View().executions) {
    if (r.status == flowstead::core::v1::WORKFLOW_STATUS_RUNNING && !r.halted) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvents(Transaction& t, const std::string& workflow_id, const std::string& run_id,
                                      int64_t expected_seq, std::vector<model::EventRecord>& events) {
  auto& log = TX(t).Mutable().events[RunKey(workflow_id, run_id)];
  if (static_cast<int64_t>(log.size()) != expected_seq) {
    return Result::Err(ErrorCode::Conflict, "expected seq " + std::to_string(expected_seq) + ", log length " + std::to_string(log.size()));
  }

  int64_t next_seq = expected_seq;
  for (auto& e : events) {
    e.workflow_id = workflow_id;
    e.run_id      = run_id;
    e.seq         = next_seq++;
    log.push_back(e);
  }
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, const std::string& workflow_id,
                                                             const std::string& run_id, int64_t from_seq) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(RunKey(workflow_id, run_id));
  if (it == s.events.end()) return {};

  const auto& log   = it->second;
  const auto  start = static_cast<std::size_t>(std::max<int64_t>(from_seq, 0));
  if (start >= log.size()) return {};
  return {log.begin() + static_cast<std::ptrdiff_t>(start), log.end()};
}

int64_t MemoryRepository::CountEvents(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(RunKey(workflow_id, run_id));
  return it == s.events.end() ? 0 : static_cast<int64_t>(it->second.size());
}

// ------------------------------------------------------------------
// Inbox
// ------------------------------------------------------------------

Result MemoryRepository::InsertInbox(Transaction& t, model::InboxRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_inbox_id++;
  s.inbox[r.id] = r;
  return Result::Ok();
}

std::vector<model::InboxRecord> MemoryRepository::ListInbox(Transaction& t, const std::string& workflow_id,
                                                            const std::string& run_id) {
  std::vector<model::InboxRecord> out;
  for (const auto& [_, r] : TX(t).View().inbox) {
    if (r.workflow_id == workflow_id && r.run_id == run_id) out.push_back(r);
  }
  return out;
}

Result MemoryRepository::DeleteInbox(Transaction& t, uint64_t id) {
  TX(t).Mutable().inbox.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Run locks
// ------------------------------------------------------------------

std::optional<model::RunLockRecord> MemoryRepository::GetRunLock(Transaction& t, const std::string& workflow_id,
                                                                 const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.run_locks.find(RunKey(workflow_id, run_id));
  if (it == s.run_locks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertRunLock(Transaction& t, const model::RunLockRecord& r) {
  TX(t).Mutable().run_locks[RunKey(r.workflow_id, r.run_id)] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteRunLock(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
  TX(t).Mutable().run_locks.erase(RunKey(workflow_id, run_id));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Activity tasks
// ------------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tasks.contains(r.task_id)) return Result::Err(ErrorCode::AlreadyExists, r.task_id);
  s.tasks[r.task_id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& task_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(task_id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(r.task_id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, r.task_id);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteTask(Transaction& t, const std::string& task_id) {
  TX(t).Mutable().tasks.erase(task_id);
  return Result::Ok();
}

std::vector<model::TaskRecord> MemoryRepository::ListVisibleTasks(Transaction& t, const std::string& task_queue, uint64_t now_ms,
                                                                  std::size_t limit) {
  std::vector<model::TaskRecord> out;
  for (const auto& [_, r] : TX(t).View().tasks) {
    if (r.task_queue == task_queue && r.lease_expiry_ms == 0 && r.visible_at_ms <= now_ms) out.push_back(r);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.visible_at_ms, a.task_id) < std::tie(b.visible_at_ms, b.task_id);
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::TaskRecord> MemoryRepository::ListExpiredTasks(Transaction& t, uint64_t now_ms) {
  std::vector<model::TaskRecord> out;
  for (const auto& [_, r] : TX(t).View().tasks) {
    const bool lease_expired = r.lease_expiry_ms != 0 && r.lease_expiry_ms <= now_ms;
    const bool never_started =
        r.lease_expiry_ms == 0 && r.schedule_to_start_deadline_ms != 0 && r.schedule_to_start_deadline_ms <= now_ms;
    if (lease_expired || never_started) out.push_back(r);
  }
  return out;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasksForRun(Transaction& t, const std::string& workflow_id,
                                                                 const std::string& run_id) {
  std::vector<model::TaskRecord> out;
  for (const auto& [_, r] : TX(t).View().tasks) {
    if (r.workflow_id == workflow_id && r.run_id == run_id) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Timers
// ------------------------------------------------------------------

Result MemoryRepository::InsertTimer(Transaction& t, const model::TimerRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = TimerKey(r.workflow_id, r.run_id, r.command_id);
  if (s.timers.contains(key)) return Result::Err(ErrorCode::AlreadyExists, key);
  s.timers[key] = r;
  return Result::Ok();
}

std::vector<model::TimerRecord> MemoryRepository::ListDueTimers(Transaction& t, uint64_t now_ms) {
  std::vector<model::TimerRecord> out;
  for (const auto& [_, r] : TX(t).View().timers) {
    if (r.fire_at_ms <= now_ms) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.fire_at_ms < b.fire_at_ms; });
  return out;
}

std::vector<model::TimerRecord> MemoryRepository::ListTimersForRun(Transaction& t, const std::string& workflow_id,
                                                                   const std::string& run_id) {
  std::vector<model::TimerRecord> out;
  for (const auto& [_, r] : TX(t).View().timers) {
    if (r.workflow_id == workflow_id && r.run_id == run_id) out.push_back(r);
  }
  return out;
}

Result MemoryRepository::DeleteTimer(Transaction& t, const std::string& workflow_id, const std::string& run_id,
                                     int64_t command_id) {
  TX(t).Mutable().timers.erase(TimerKey(workflow_id, run_id, command_id));
  return Result::Ok();
}

} // namespace flowstead::db::memory
