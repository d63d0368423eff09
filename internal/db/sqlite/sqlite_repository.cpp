#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace flowstead::db::sqlite {

using flowstead::db::ErrorCode;
using flowstead::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
public:
  Statement(sqlite3* db, const std::string& sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const { return rc_ == SQLITE_OK && st_ != nullptr; }
  sqlite3_stmt* Get() const { return st_; }

private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string{};
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

void ThrowIfNotPrepared(const Statement& st, sqlite3* db) {
    if (!st.Ok()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Row mapping
// ------------------------------------------------------------------

constexpr const char* kExecutionColumns =
    "workflow_id,run_id,workflow_type,task_queue,input,status,result,failure,"
    "parent_workflow_id,parent_run_id,parent_command_id,start_time_ms,close_time_ms,run_deadline_ms,"
    "history_length,is_current,halted,halt_reason,continued_from_run_id,continued_as_run_id";

// Binds ?1..?20 in kExecutionColumns order.
void BindExecution(sqlite3_stmt* st, const model::ExecutionRecord& r) {
    BindText(st, 1, r.workflow_id);
    BindText(st, 2, r.run_id);
    BindText(st, 3, r.workflow_type);
    BindText(st, 4, r.task_queue);
    BindBlob(st, 5, r.input);
    BindI64(st, 6, static_cast<int64_t>(r.status));
    BindBlob(st, 7, r.result);
    BindBlob(st, 8, r.failure);
    BindText(st, 9, r.parent_workflow_id);
    BindText(st, 10, r.parent_run_id);
    BindI64(st, 11, r.parent_command_id);
    BindU64(st, 12, r.start_time_ms);
    BindU64(st, 13, r.close_time_ms);
    BindU64(st, 14, r.run_deadline_ms);
    BindI64(st, 15, r.history_length);
    BindI64(st, 16, r.is_current ? 1 : 0);
    BindI64(st, 17, r.halted ? 1 : 0);
    BindText(st, 18, r.halt_reason);
    BindText(st, 19, r.continued_from_run_id);
    BindText(st, 20, r.continued_as_run_id);
}

model::ExecutionRecord ReadExecution(sqlite3_stmt* st) {
    model::ExecutionRecord r;
    r.workflow_id           = ColText(st, 0);
    r.run_id                = ColText(st, 1);
    r.workflow_type         = ColText(st, 2);
    r.task_queue            = ColText(st, 3);
    r.input                 = ColBlob(st, 4);
    r.status                = static_cast<flowstead::core::v1::WorkflowStatus>(ColI64(st, 5));
    r.result                = ColBlob(st, 6);
    r.failure               = ColBlob(st, 7);
    r.parent_workflow_id    = ColText(st, 8);
    r.parent_run_id         = ColText(st, 9);
    r.parent_command_id     = ColI64(st, 10);
    r.start_time_ms         = ColU64(st, 11);
    r.close_time_ms         = ColU64(st, 12);
    r.run_deadline_ms       = ColU64(st, 13);
    r.history_length        = ColI64(st, 14);
    r.is_current            = ColI64(st, 15) != 0;
    r.halted                = ColI64(st, 16) != 0;
    r.halt_reason           = ColText(st, 17);
    r.continued_from_run_id = ColText(st, 18);
    r.continued_as_run_id   = ColText(st, 19);
    return r;
}

constexpr const char* kTaskColumns =
    "task_id,task_queue,workflow_id,run_id,command_id,attempt,visible_at_ms,lease_owner,lease_expiry_ms,"
    "schedule_to_start_deadline_ms,payload";

void BindTask(sqlite3_stmt* st, const model::TaskRecord& r) {
    BindText(st, 1, r.task_id);
    BindText(st, 2, r.task_queue);
    BindText(st, 3, r.workflow_id);
    BindText(st, 4, r.run_id);
    BindI64(st, 5, r.command_id);
    BindI64(st, 6, r.attempt);
    BindU64(st, 7, r.visible_at_ms);
    BindText(st, 8, r.lease_owner);
    BindU64(st, 9, r.lease_expiry_ms);
    BindU64(st, 10, r.schedule_to_start_deadline_ms);
    BindBlob(st, 11, r.payload);
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
    model::TaskRecord r;
    r.task_id                       = ColText(st, 0);
    r.task_queue                    = ColText(st, 1);
    r.workflow_id                   = ColText(st, 2);
    r.run_id                        = ColText(st, 3);
    r.command_id                    = ColI64(st, 4);
    r.attempt                       = static_cast<int32_t>(ColI64(st, 5));
    r.visible_at_ms                 = ColU64(st, 6);
    r.lease_owner                   = ColText(st, 7);
    r.lease_expiry_ms               = ColU64(st, 8);
    r.schedule_to_start_deadline_ms = ColU64(st, 9);
    r.payload                       = ColBlob(st, 10);
    return r;
}

model::TimerRecord ReadTimer(sqlite3_stmt* st) {
    model::TimerRecord r;
    r.workflow_id = ColText(st, 0);
    r.run_id      = ColText(st, 1);
    r.command_id  = ColI64(st, 2);
    r.timer_id    = ColText(st, 3);
    r.fire_at_ms  = ColU64(st, 4);
    return r;
}

template <typename Record, typename Reader>
std::vector<Record> Collect(sqlite3_stmt* st, Reader read) {
    std::vector<Record> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(read(st));
    }
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("INSERT INTO executions(") + kExecutionColumns +
                         ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19,?20);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindExecution(st.Get(), r);
    int rc = sqlite3_step(st.Get());
    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, r.workflow_id + "/" + r.run_id);
    return Translate(db, rc);
}

std::optional<model::ExecutionRecord>
SqliteRepository::GetExecution(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kExecutionColumns + " FROM executions WHERE workflow_id=? AND run_id=?;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);
    if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
    return ReadExecution(st.Get());
}

std::optional<model::ExecutionRecord>
SqliteRepository::GetCurrentExecution(Transaction& t, const std::string& workflow_id) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kExecutionColumns +
                         " FROM executions WHERE workflow_id=? AND is_current=1 LIMIT 1;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, workflow_id);
    if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
    return ReadExecution(st.Get());
}

Result SqliteRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "UPDATE executions SET workflow_type=?3,task_queue=?4,input=?5,status=?6,result=?7,failure=?8,"
                 "parent_workflow_id=?9,parent_run_id=?10,parent_command_id=?11,start_time_ms=?12,close_time_ms=?13,"
                 "run_deadline_ms=?14,history_length=?15,is_current=?16,halted=?17,halt_reason=?18,"
                 "continued_from_run_id=?19,continued_as_run_id=?20 WHERE workflow_id=?1 AND run_id=?2;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindExecution(st.Get(), r);
    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.workflow_id + "/" + r.run_id);
    return Result::Ok();
}

std::vector<model::ExecutionRecord> SqliteRepository::ListExecutions(Transaction& t, const model::ExecutionFilter& filter,
                                                                     const std::optional<model::ExecutionCursor>& after,
                                                                     std::size_t limit) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kExecutionColumns + " FROM executions WHERE 1=1";
    if (filter.status) sql += " AND status=?";
    if (filter.workflow_type) sql += " AND workflow_type=?";
    if (after) sql += " AND (start_time_ms>? OR (start_time_ms=? AND run_id>?))";
    sql += " ORDER BY start_time_ms ASC, run_id ASC";
    if (limit > 0) sql += " LIMIT " + std::to_string(limit);
    sql += ";";

    Statement st(db, sql);
    ThrowIfNotPrepared(st, db);

    int idx = 1;
    if (filter.status) BindI64(st.Get(), idx++, static_cast<int64_t>(*filter.status));
    if (filter.workflow_type) BindText(st.Get(), idx++, *filter.workflow_type);
    if (after) {
        BindU64(st.Get(), idx++, after->start_time_ms);
        BindU64(st.Get(), idx++, after->start_time_ms);
        BindText(st.Get(), idx++, after->run_id);
    }

    return Collect<model::ExecutionRecord>(st.Get(), ReadExecution);
}

std::vector<model::ExecutionRecord> SqliteRepository::ListOpenExecutions(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kExecutionColumns + " FROM executions WHERE status=? AND halted=0;");
    ThrowIfNotPrepared(st, db);

    BindI64(st.Get(), 1, static_cast<int64_t>(flowstead::core::v1::WORKFLOW_STATUS_RUNNING));
    return Collect<model::ExecutionRecord>(st.Get(), ReadExecution);
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvents(Transaction& t, const std::string& workflow_id, const std::string& run_id,
                                      int64_t expected_seq, std::vector<model::EventRecord>& events) {
    auto* db = TX(t).Handle();

    const int64_t length = CountEvents(t, workflow_id, run_id);
    if (length != expected_seq) {
        return Result::Err(ErrorCode::Conflict,
                           "expected seq " + std::to_string(expected_seq) + ", log length " + std::to_string(length));
    }

    Statement st(db,
                 "INSERT INTO history_events(workflow_id,run_id,seq,event_type,timestamp_ms,payload) "
                 "VALUES(?,?,?,?,?,?);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int64_t next_seq = expected_seq;
    for (auto& e : events) {
        e.workflow_id = workflow_id;
        e.run_id      = run_id;
        e.seq         = next_seq++;

        sqlite3_reset(st.Get());
        sqlite3_clear_bindings(st.Get());

        BindText(st.Get(), 1, e.workflow_id);
        BindText(st.Get(), 2, e.run_id);
        BindI64(st.Get(), 3, e.seq);
        BindI64(st.Get(), 4, e.event_type);
        BindU64(st.Get(), 5, e.timestamp_ms);
        BindBlob(st.Get(), 6, e.payload);

        int rc = sqlite3_step(st.Get());
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::Conflict, sqlite3_errmsg(db));
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, const std::string& workflow_id,
                                                             const std::string& run_id, int64_t from_seq) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "SELECT workflow_id,run_id,seq,event_type,timestamp_ms,payload FROM history_events "
                 "WHERE workflow_id=? AND run_id=? AND seq>=? ORDER BY seq ASC;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);
    BindI64(st.Get(), 3, from_seq);

    return Collect<model::EventRecord>(st.Get(), [](sqlite3_stmt* row) {
        model::EventRecord e;
        e.workflow_id  = ColText(row, 0);
        e.run_id       = ColText(row, 1);
        e.seq          = ColI64(row, 2);
        e.event_type   = static_cast<int32_t>(ColI64(row, 3));
        e.timestamp_ms = ColU64(row, 4);
        e.payload      = ColBlob(row, 5);
        return e;
    });
}

int64_t SqliteRepository::CountEvents(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT COUNT(*) FROM history_events WHERE workflow_id=? AND run_id=?;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);
    if (sqlite3_step(st.Get()) != SQLITE_ROW) return 0;
    return ColI64(st.Get(), 0);
}

// ------------------------------------------------------------------
// Inbox
// ------------------------------------------------------------------

Result SqliteRepository::InsertInbox(Transaction& t, model::InboxRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO inbox(workflow_id,run_id,created_at_ms,payload) VALUES(?,?,?,?);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, r.workflow_id);
    BindText(st.Get(), 2, r.run_id);
    BindU64(st.Get(), 3, r.created_at_ms);
    BindBlob(st.Get(), 4, r.payload);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::InboxRecord> SqliteRepository::ListInbox(Transaction& t, const std::string& workflow_id,
                                                            const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "SELECT id,workflow_id,run_id,created_at_ms,payload FROM inbox "
                 "WHERE workflow_id=? AND run_id=? ORDER BY id ASC;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);

    return Collect<model::InboxRecord>(st.Get(), [](sqlite3_stmt* row) {
        model::InboxRecord r;
        r.id            = ColU64(row, 0);
        r.workflow_id   = ColText(row, 1);
        r.run_id        = ColText(row, 2);
        r.created_at_ms = ColU64(row, 3);
        r.payload       = ColBlob(row, 4);
        return r;
    });
}

Result SqliteRepository::DeleteInbox(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM inbox WHERE id=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.Get(), 1, id);
    return Translate(db, sqlite3_step(st.Get()));
}

// ------------------------------------------------------------------
// Run locks
// ------------------------------------------------------------------

std::optional<model::RunLockRecord>
SqliteRepository::GetRunLock(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "SELECT workflow_id,run_id,holder_id,lease_expiry_ms,ttl_ms FROM run_locks "
                 "WHERE workflow_id=? AND run_id=?;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);
    if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;

    model::RunLockRecord r;
    r.workflow_id     = ColText(st.Get(), 0);
    r.run_id          = ColText(st.Get(), 1);
    r.holder_id       = ColText(st.Get(), 2);
    r.lease_expiry_ms = ColU64(st.Get(), 3);
    r.ttl_ms          = ColU64(st.Get(), 4);
    return r;
}

Result SqliteRepository::UpsertRunLock(Transaction& t, const model::RunLockRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "INSERT INTO run_locks(workflow_id,run_id,holder_id,lease_expiry_ms,ttl_ms) VALUES(?,?,?,?,?) "
                 "ON CONFLICT(workflow_id,run_id) DO UPDATE SET holder_id=excluded.holder_id,"
                 " lease_expiry_ms=excluded.lease_expiry_ms, ttl_ms=excluded.ttl_ms;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, r.workflow_id);
    BindText(st.Get(), 2, r.run_id);
    BindText(st.Get(), 3, r.holder_id);
    BindU64(st.Get(), 4, r.lease_expiry_ms);
    BindU64(st.Get(), 5, r.ttl_ms);
    return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::DeleteRunLock(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM run_locks WHERE workflow_id=? AND run_id=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);
    return Translate(db, sqlite3_step(st.Get()));
}

// ------------------------------------------------------------------
// Activity tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("INSERT INTO activity_tasks(") + kTaskColumns + ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindTask(st.Get(), r);
    int rc = sqlite3_step(st.Get());
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.task_id);
    return Translate(db, rc);
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& task_id) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kTaskColumns + " FROM activity_tasks WHERE task_id=?;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, task_id);
    if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
    return ReadTask(st.Get());
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "UPDATE activity_tasks SET task_queue=?2,workflow_id=?3,run_id=?4,command_id=?5,attempt=?6,"
                 "visible_at_ms=?7,lease_owner=?8,lease_expiry_ms=?9,schedule_to_start_deadline_ms=?10,payload=?11 "
                 "WHERE task_id=?1;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindTask(st.Get(), r);
    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.task_id);
    return Result::Ok();
}

Result SqliteRepository::DeleteTask(Transaction& t, const std::string& task_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM activity_tasks WHERE task_id=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, task_id);
    return Translate(db, sqlite3_step(st.Get()));
}

std::vector<model::TaskRecord> SqliteRepository::ListVisibleTasks(Transaction& t, const std::string& task_queue,
                                                                  uint64_t now_ms, std::size_t limit) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kTaskColumns +
                      " FROM activity_tasks WHERE task_queue=? AND lease_expiry_ms=0 AND visible_at_ms<=?"
                      " ORDER BY visible_at_ms ASC, task_id ASC";
    if (limit > 0) sql += " LIMIT " + std::to_string(limit);
    sql += ";";

    Statement st(db, sql);
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, task_queue);
    BindU64(st.Get(), 2, now_ms);
    return Collect<model::TaskRecord>(st.Get(), ReadTask);
}

std::vector<model::TaskRecord> SqliteRepository::ListExpiredTasks(Transaction& t, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kTaskColumns +
                         " FROM activity_tasks WHERE (lease_expiry_ms<>0 AND lease_expiry_ms<=?1)"
                         " OR (lease_expiry_ms=0 AND schedule_to_start_deadline_ms<>0 AND schedule_to_start_deadline_ms<=?1);");
    ThrowIfNotPrepared(st, db);

    BindU64(st.Get(), 1, now_ms);
    return Collect<model::TaskRecord>(st.Get(), ReadTask);
}

std::vector<model::TaskRecord> SqliteRepository::ListTasksForRun(Transaction& t, const std::string& workflow_id,
                                                                 const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kTaskColumns + " FROM activity_tasks WHERE workflow_id=? AND run_id=?;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);
    return Collect<model::TaskRecord>(st.Get(), ReadTask);
}

// ------------------------------------------------------------------
// Timers
// ------------------------------------------------------------------

Result SqliteRepository::InsertTimer(Transaction& t, const model::TimerRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO timers(workflow_id,run_id,command_id,timer_id,fire_at_ms) VALUES(?,?,?,?,?);");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, r.workflow_id);
    BindText(st.Get(), 2, r.run_id);
    BindI64(st.Get(), 3, r.command_id);
    BindText(st.Get(), 4, r.timer_id);
    BindU64(st.Get(), 5, r.fire_at_ms);

    int rc = sqlite3_step(st.Get());
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.timer_id);
    return Translate(db, rc);
}

std::vector<model::TimerRecord> SqliteRepository::ListDueTimers(Transaction& t, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "SELECT workflow_id,run_id,command_id,timer_id,fire_at_ms FROM timers "
                 "WHERE fire_at_ms<=? ORDER BY fire_at_ms ASC;");
    ThrowIfNotPrepared(st, db);

    BindU64(st.Get(), 1, now_ms);
    return Collect<model::TimerRecord>(st.Get(), ReadTimer);
}

std::vector<model::TimerRecord> SqliteRepository::ListTimersForRun(Transaction& t, const std::string& workflow_id,
                                                                   const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "SELECT workflow_id,run_id,command_id,timer_id,fire_at_ms FROM timers "
                 "WHERE workflow_id=? AND run_id=?;");
    ThrowIfNotPrepared(st, db);

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);
    return Collect<model::TimerRecord>(st.Get(), ReadTimer);
}

Result SqliteRepository::DeleteTimer(Transaction& t, const std::string& workflow_id, const std::string& run_id,
                                     int64_t command_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM timers WHERE workflow_id=? AND run_id=? AND command_id=?;");
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, workflow_id);
    BindText(st.Get(), 2, run_id);
    BindI64(st.Get(), 3, command_id);
    return Translate(db, sqlite3_step(st.Get()));
}

} // namespace flowstead::db::sqlite
