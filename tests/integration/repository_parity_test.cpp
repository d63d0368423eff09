#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"

#if FLOWSTEAD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if FLOWSTEAD_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using flowstead::db::ErrorCode;
using flowstead::db::Repository;
using flowstead::db::memory::MemoryRepository;
using flowstead::db::model::EventRecord;
using flowstead::db::model::ExecutionCursor;
using flowstead::db::model::ExecutionFilter;
using flowstead::db::model::ExecutionRecord;
using flowstead::db::model::InboxRecord;
using flowstead::db::model::RunLockRecord;
using flowstead::db::model::TaskRecord;
using flowstead::db::model::TimerRecord;
namespace core = flowstead::core::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

ExecutionRecord MakeExecution(const std::string& workflow_id, const std::string& run_id, uint64_t start_ms,
                              const std::string& type = "ingest") {
  ExecutionRecord r;
  r.workflow_id   = workflow_id;
  r.run_id        = run_id;
  r.workflow_type = type;
  r.task_queue    = "default";
  r.input         = std::string("in\0put", 6);
  r.start_time_ms = start_ms;
  return r;
}

EventRecord MakeEvent(int32_t type, const std::string& payload) {
  EventRecord e;
  e.event_type   = type;
  e.timestamp_ms = 1000;
  e.payload      = payload;
  return e;
}

void VerifyExecutionLifecycle(Repository& repo, const std::string& prefix) {
  const auto wf = prefix + "-exec";
  auto       tx = repo.Begin();

  auto first = MakeExecution(wf, "run-1", 100);
  assert(repo.InsertExecution(*tx, first));
  assert(repo.InsertExecution(*tx, first).code == ErrorCode::AlreadyExists);

  auto read = repo.GetExecution(*tx, wf, "run-1");
  assert(read.has_value());
  assert(read->input == first.input);
  assert(read->status == core::WORKFLOW_STATUS_RUNNING);
  assert(read->is_current);

  read->status              = core::WORKFLOW_STATUS_CONTINUED_AS_NEW;
  read->is_current          = false;
  read->close_time_ms       = 200;
  read->continued_as_run_id = "run-2";
  read->history_length      = 7;
  assert(repo.UpdateExecution(*tx, *read));

  auto second                  = MakeExecution(wf, "run-2", 200);
  second.continued_from_run_id = "run-1";
  second.parent_workflow_id    = "parent";
  second.parent_run_id         = "parent-run";
  second.parent_command_id     = 4;
  assert(repo.InsertExecution(*tx, second));

  auto current = repo.GetCurrentExecution(*tx, wf);
  assert(current.has_value());
  assert(current->run_id == "run-2");
  assert(current->continued_from_run_id == "run-1");
  assert(current->parent_command_id == 4);

  auto closed = repo.GetExecution(*tx, wf, "run-1");
  assert(closed->status == core::WORKFLOW_STATUS_CONTINUED_AS_NEW);
  assert(closed->continued_as_run_id == "run-2");
  assert(closed->history_length == 7);

  assert(repo.UpdateExecution(*tx, MakeExecution(wf, "run-missing", 0)).code == ErrorCode::NotFound);
  assert(!repo.GetCurrentExecution(*tx, prefix + "-nobody").has_value());

  tx->Commit();
}

void VerifyListingOrderAndFilters(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  // Unique start times keep other suites' rows out of the window.
  const uint64_t base = 5'000'000'000ULL + (NowMs() % 1000) * 1000;
  auto           a    = MakeExecution(prefix + "-list-a", "r-a", base + 3, "scan");
  auto           b    = MakeExecution(prefix + "-list-b", "r-b", base + 1, "scan");
  auto           c    = MakeExecution(prefix + "-list-c", "r-c", base + 2, "report");
  c.status            = core::WORKFLOW_STATUS_FAILED;
  auto halted         = MakeExecution(prefix + "-list-d", "r-d", base + 4, "scan");
  halted.halted       = true;
  halted.halt_reason  = "replay diverged";
  for (const auto& r : {a, b, c, halted}) {
    assert(repo.InsertExecution(*tx, r));
  }

  const ExecutionCursor start{base, ""};
  auto                  all = repo.ListExecutions(*tx, {}, start, 0);
  std::vector<std::string> ids;
  for (const auto& r : all) {
    if (r.start_time_ms > base && r.start_time_ms <= base + 4) ids.push_back(r.run_id);
  }
  assert((ids == std::vector<std::string>{"r-b", "r-c", "r-a", "r-d"}));

  ExecutionFilter scans;
  scans.workflow_type = "scan";
  auto page           = repo.ListExecutions(*tx, scans, start, 2);
  assert(page.size() == 2);
  assert(page[0].run_id == "r-b");
  assert(page[1].run_id == "r-a");

  auto next = repo.ListExecutions(*tx, scans, ExecutionCursor{page[1].start_time_ms, page[1].run_id}, 2);
  assert(!next.empty());
  assert(next[0].run_id == "r-d");
  assert(next[0].halted);
  assert(next[0].halt_reason == "replay diverged");

  ExecutionFilter failed;
  failed.status = core::WORKFLOW_STATUS_FAILED;
  auto failures = repo.ListExecutions(*tx, failed, start, 0);
  assert(failures.size() == 1);
  assert(failures[0].run_id == "r-c");

  bool saw_halted = false;
  bool saw_open   = false;
  for (const auto& r : repo.ListOpenExecutions(*tx)) {
    saw_halted = saw_halted || r.run_id == "r-d";
    saw_open   = saw_open || r.run_id == "r-a";
  }
  assert(saw_open);
  assert(!saw_halted);

  tx->Commit();
}

void VerifyHistoryAppend(Repository& repo, const std::string& prefix) {
  const auto wf = prefix + "-history";
  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> batch{MakeEvent(1, "started"), MakeEvent(2, std::string("bin\0ary", 7))};
    assert(repo.AppendEvents(*tx, wf, "r", 0, batch));
    assert(batch[0].seq == 0);
    assert(batch[1].seq == 1);
    tx->Commit();
  }
  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> stale{MakeEvent(3, "late")};
    assert(repo.AppendEvents(*tx, wf, "r", 1, stale).code == ErrorCode::Conflict);
    tx->Rollback();
  }
  {
    auto                     tx = repo.Begin();
    std::vector<EventRecord> next{MakeEvent(3, "scheduled")};
    assert(repo.AppendEvents(*tx, wf, "r", 2, next));
    assert(next[0].seq == 2);
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto events = repo.ReadEvents(*tx, wf, "r", 0);
  assert(events.size() == 3);
  assert(events[1].payload == std::string("bin\0ary", 7));
  assert(events[2].event_type == 3);
  assert(repo.ReadEvents(*tx, wf, "r", 2).size() == 1);
  assert(repo.CountEvents(*tx, wf, "r") == 3);
  assert(repo.CountEvents(*tx, wf, "other") == 0);
  tx->Commit();
}

void VerifyInbox(Repository& repo, const std::string& prefix) {
  const auto wf = prefix + "-inbox";
  auto       tx = repo.Begin();

  InboxRecord first{.workflow_id = wf, .run_id = "r", .created_at_ms = 10, .payload = "signal-1"};
  InboxRecord second{.workflow_id = wf, .run_id = "r", .created_at_ms = 5, .payload = "signal-2"};
  assert(repo.InsertInbox(*tx, first));
  assert(repo.InsertInbox(*tx, second));
  assert(first.id != 0);
  assert(second.id > first.id);

  auto pending = repo.ListInbox(*tx, wf, "r");
  assert(pending.size() == 2);
  assert(pending[0].payload == "signal-1");

  assert(repo.DeleteInbox(*tx, first.id));
  pending = repo.ListInbox(*tx, wf, "r");
  assert(pending.size() == 1);
  assert(pending[0].payload == "signal-2");

  tx->Commit();
}

void VerifyRunLocks(Repository& repo, const std::string& prefix) {
  const auto wf = prefix + "-lock";
  auto       tx = repo.Begin();

  assert(!repo.GetRunLock(*tx, wf, "r").has_value());
  assert(repo.UpsertRunLock(*tx, RunLockRecord{wf, "r", "engine-a", 1000, 500}));
  assert(repo.UpsertRunLock(*tx, RunLockRecord{wf, "r", "engine-b", 2000, 500}));

  auto lock = repo.GetRunLock(*tx, wf, "r");
  assert(lock.has_value());
  assert(lock->holder_id == "engine-b");
  assert(lock->lease_expiry_ms == 2000);
  assert(lock->ttl_ms == 500);

  assert(repo.DeleteRunLock(*tx, wf, "r"));
  assert(!repo.GetRunLock(*tx, wf, "r").has_value());
  tx->Commit();
}

void VerifyTasks(Repository& repo, const std::string& prefix) {
  const auto queue = prefix + "-queue";
  auto       tx    = repo.Begin();

  TaskRecord ready{.task_id = prefix + "-t1", .task_queue = queue, .workflow_id = "wf", .run_id = "r", .command_id = 1, .visible_at_ms = 100};
  TaskRecord later{.task_id = prefix + "-t2", .task_queue = queue, .workflow_id = "wf", .run_id = "r", .command_id = 2, .visible_at_ms = 500};
  TaskRecord stale{.task_id                       = prefix + "-t3",
                   .task_queue                    = queue,
                   .workflow_id                   = "wf",
                   .run_id                        = "r2",
                   .command_id                    = 1,
                   .visible_at_ms                 = 50,
                   .schedule_to_start_deadline_ms = 150};
  assert(repo.InsertTask(*tx, ready));
  assert(repo.InsertTask(*tx, later));
  assert(repo.InsertTask(*tx, stale));
  assert(repo.InsertTask(*tx, ready).code == ErrorCode::AlreadyExists);

  auto visible = repo.ListVisibleTasks(*tx, queue, 200, 0);
  assert(visible.size() == 2);
  assert(visible[0].task_id == stale.task_id);
  assert(visible[1].task_id == ready.task_id);
  assert(repo.ListVisibleTasks(*tx, queue, 200, 1).size() == 1);
  assert(repo.ListVisibleTasks(*tx, prefix + "-other", 200, 0).empty());

  ready.lease_owner     = "worker-1";
  ready.lease_expiry_ms = 300;
  ready.attempt         = 2;
  assert(repo.UpdateTask(*tx, ready));
  assert(repo.ListVisibleTasks(*tx, queue, 200, 0).size() == 1);

  std::vector<std::string> expired;
  for (const auto& t : repo.ListExpiredTasks(*tx, 400)) {
    if (t.task_queue == queue) expired.push_back(t.task_id);
  }
  // ready: lease ran out. stale: never started in time. later: still pending.
  assert(expired.size() == 2);

  assert(repo.ListTasksForRun(*tx, "wf", "r").size() == 2);

  auto read = repo.GetTask(*tx, ready.task_id);
  assert(read.has_value());
  assert(read->attempt == 2);
  assert(read->lease_owner == "worker-1");

  assert(repo.DeleteTask(*tx, ready.task_id));
  assert(!repo.GetTask(*tx, ready.task_id).has_value());
  assert(repo.UpdateTask(*tx, ready).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyTimers(Repository& repo, const std::string& prefix) {
  const auto wf = prefix + "-timer";
  auto       tx = repo.Begin();

  assert(repo.InsertTimer(*tx, TimerRecord{wf, "r", 2, "t-2", 900}));
  assert(repo.InsertTimer(*tx, TimerRecord{wf, "r", 1, "t-1", 300}));
  assert(repo.InsertTimer(*tx, TimerRecord{wf, "r", 3, "t-3", 5000}));

  std::vector<int64_t> due;
  for (const auto& t : repo.ListDueTimers(*tx, 1000)) {
    if (t.workflow_id == wf) due.push_back(t.command_id);
  }
  assert((due == std::vector<int64_t>{1, 2}));

  assert(repo.ListTimersForRun(*tx, wf, "r").size() == 3);
  assert(repo.DeleteTimer(*tx, wf, "r", 1));
  assert(repo.ListTimersForRun(*tx, wf, "r").size() == 2);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto wf = prefix + "-rollback";
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeExecution(wf, "r", 1)));
    std::vector<EventRecord> batch{MakeEvent(1, "started")};
    assert(repo.AppendEvents(*tx, wf, "r", 0, batch));
    tx->Rollback();
  }
  {
    // Destroyed without Commit.
    auto        tx = repo.Begin();
    InboxRecord record{.workflow_id = wf, .run_id = "r", .created_at_ms = 1, .payload = "lost"};
    assert(repo.InsertInbox(*tx, record));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetExecution(*check_tx, wf, "r").has_value());
  assert(repo.CountEvents(*check_tx, wf, "r") == 0);
  assert(repo.ListInbox(*check_tx, wf, "r").empty());
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto wf   = prefix + "-durable";
  auto       repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertExecution(*tx, MakeExecution(wf, "r", 42)));
    std::vector<EventRecord> batch{MakeEvent(1, "started"), MakeEvent(3, "scheduled")};
    assert(repo->AppendEvents(*tx, wf, "r", 0, batch));
    assert(repo->UpsertRunLock(*tx, RunLockRecord{wf, "r", "engine-a", 99, 10}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx        = repo->Begin();
  auto execution = repo->GetExecution(*tx, wf, "r");
  assert(execution.has_value());
  assert(execution->start_time_ms == 42);
  assert(repo->CountEvents(*tx, wf, "r") == 2);
  auto lock = repo->GetRunLock(*tx, wf, "r");
  assert(lock.has_value());
  assert(lock->holder_id == "engine-a");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if FLOWSTEAD_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("flowstead_repository_parity_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<flowstead::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : flowstead::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<flowstead::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if FLOWSTEAD_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FLOWSTEAD_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FLOWSTEAD_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    {
      pqxx::connection conn(conninfo);
      pqxx::work       tx(conn);
      for (const auto& sql : flowstead::db::sql::PostgresSchema()) {
        tx.exec(sql);
      }
      tx.commit();
    }
    return std::make_shared<flowstead::db::postgres::PgRepository>(std::make_shared<flowstead::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyExecutionLifecycle(*repo, prefix);
  VerifyListingOrderAndFilters(*repo, prefix);
  VerifyHistoryAppend(*repo, prefix);
  VerifyInbox(*repo, prefix);
  VerifyRunLocks(*repo, prefix);
  VerifyTasks(*repo, prefix);
  VerifyTimers(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if FLOWSTEAD_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if FLOWSTEAD_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
