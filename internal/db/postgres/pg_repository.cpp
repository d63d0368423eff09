#include "pg_repository.hpp"

namespace flowstead::db::postgres {

namespace {

constexpr const char* kExecutionColumns =
    "workflow_id,run_id,workflow_type,task_queue,input,status,result,failure,"
    "parent_workflow_id,parent_run_id,parent_command_id,start_time_ms,close_time_ms,run_deadline_ms,"
    "history_length,is_current,halted,halt_reason,continued_from_run_id,continued_as_run_id";

constexpr const char* kTaskColumns =
    "task_id,task_queue,workflow_id,run_id,command_id,attempt,visible_at_ms,lease_owner,lease_expiry_ms,"
    "schedule_to_start_deadline_ms,payload";

std::basic_string_view<std::byte> Bytes(const std::string& s) {
  return pqxx::binary_cast(s);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

std::string Blob(const pqxx::field& f) {
  if (f.is_null()) return {};
  const auto bytes = f.as<std::basic_string<std::byte>>();
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

pqxx::params ExecutionParams(const model::ExecutionRecord& r) {
  pqxx::params p;
  p.append(r.workflow_id);
  p.append(r.run_id);
  p.append(r.workflow_type);
  p.append(r.task_queue);
  p.append(Bytes(r.input));
  p.append(static_cast<int>(r.status));
  p.append(Bytes(r.result));
  p.append(Bytes(r.failure));
  p.append(r.parent_workflow_id);
  p.append(r.parent_run_id);
  p.append(r.parent_command_id);
  p.append(static_cast<int64_t>(r.start_time_ms));
  p.append(static_cast<int64_t>(r.close_time_ms));
  p.append(static_cast<int64_t>(r.run_deadline_ms));
  p.append(r.history_length);
  p.append(r.is_current);
  p.append(r.halted);
  p.append(r.halt_reason);
  p.append(r.continued_from_run_id);
  p.append(r.continued_as_run_id);
  return p;
}

model::ExecutionRecord ReadExecution(const pqxx::row& row) {
  model::ExecutionRecord r;
  r.workflow_id           = Text(row[0]);
  r.run_id                = Text(row[1]);
  r.workflow_type         = Text(row[2]);
  r.task_queue            = Text(row[3]);
  r.input                 = Blob(row[4]);
  r.status                = static_cast<flowstead::core::v1::WorkflowStatus>(row[5].as<int>());
  r.result                = Blob(row[6]);
  r.failure               = Blob(row[7]);
  r.parent_workflow_id    = Text(row[8]);
  r.parent_run_id         = Text(row[9]);
  r.parent_command_id     = row[10].as<int64_t>();
  r.start_time_ms         = static_cast<uint64_t>(row[11].as<int64_t>());
  r.close_time_ms         = static_cast<uint64_t>(row[12].as<int64_t>());
  r.run_deadline_ms       = static_cast<uint64_t>(row[13].as<int64_t>());
  r.history_length        = row[14].as<int64_t>();
  r.is_current            = row[15].as<bool>();
  r.halted                = row[16].as<bool>();
  r.halt_reason           = Text(row[17]);
  r.continued_from_run_id = Text(row[18]);
  r.continued_as_run_id   = Text(row[19]);
  return r;
}

pqxx::params TaskParams(const model::TaskRecord& r) {
  pqxx::params p;
  p.append(r.task_id);
  p.append(r.task_queue);
  p.append(r.workflow_id);
  p.append(r.run_id);
  p.append(r.command_id);
  p.append(r.attempt);
  p.append(static_cast<int64_t>(r.visible_at_ms));
  p.append(r.lease_owner);
  p.append(static_cast<int64_t>(r.lease_expiry_ms));
  p.append(static_cast<int64_t>(r.schedule_to_start_deadline_ms));
  p.append(Bytes(r.payload));
  return p;
}

model::TaskRecord ReadTask(const pqxx::row& row) {
  model::TaskRecord r;
  r.task_id                       = Text(row[0]);
  r.task_queue                    = Text(row[1]);
  r.workflow_id                   = Text(row[2]);
  r.run_id                        = Text(row[3]);
  r.command_id                    = row[4].as<int64_t>();
  r.attempt                       = row[5].as<int32_t>();
  r.visible_at_ms                 = static_cast<uint64_t>(row[6].as<int64_t>());
  r.lease_owner                   = Text(row[7]);
  r.lease_expiry_ms               = static_cast<uint64_t>(row[8].as<int64_t>());
  r.schedule_to_start_deadline_ms = static_cast<uint64_t>(row[9].as<int64_t>());
  r.payload                       = Blob(row[10]);
  return r;
}

model::TimerRecord ReadTimer(const pqxx::row& row) {
  model::TimerRecord r;
  r.workflow_id = Text(row[0]);
  r.run_id      = Text(row[1]);
  r.command_id  = row[2].as<int64_t>();
  r.timer_id    = Text(row[3]);
  r.fire_at_ms  = static_cast<uint64_t>(row[4].as<int64_t>());
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> Collect(const pqxx::result& res, Reader read) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result PgRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO executions(") + kExecutionColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20);",
                             ExecutionParams(r));
    return Result::Ok();
  } catch (const pqxx::unique_violation&) {
    return Result::Err(ErrorCode::AlreadyExists, r.workflow_id + "/" + r.run_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ExecutionRecord>
PgRepository::GetExecution(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
  // row lock serializes decision cycles on the same run
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kExecutionColumns +
                                          " FROM executions WHERE workflow_id=$1 AND run_id=$2 FOR UPDATE;",
                                      workflow_id, run_id);
  if (res.empty()) return std::nullopt;
  return ReadExecution(res[0]);
}

std::optional<model::ExecutionRecord> PgRepository::GetCurrentExecution(Transaction& t, const std::string& workflow_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kExecutionColumns +
                                          " FROM executions WHERE workflow_id=$1 AND is_current LIMIT 1;",
                                      workflow_id);
  if (res.empty()) return std::nullopt;
  return ReadExecution(res[0]);
}

Result PgRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE executions SET workflow_type=$3,task_queue=$4,input=$5,status=$6,result=$7,failure=$8,"
        "parent_workflow_id=$9,parent_run_id=$10,parent_command_id=$11,start_time_ms=$12,close_time_ms=$13,"
        "run_deadline_ms=$14,history_length=$15,is_current=$16,halted=$17,halt_reason=$18,"
        "continued_from_run_id=$19,continued_as_run_id=$20 WHERE workflow_id=$1 AND run_id=$2;",
        ExecutionParams(r));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.workflow_id + "/" + r.run_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ExecutionRecord> PgRepository::ListExecutions(Transaction& t, const model::ExecutionFilter& filter,
                                                                 const std::optional<model::ExecutionCursor>& after,
                                                                 std::size_t limit) {
  std::string  sql = std::string("SELECT ") + kExecutionColumns + " FROM executions WHERE TRUE";
  pqxx::params params;
  int          next = 1;

  if (filter.status) {
    sql += " AND status=$" + std::to_string(next++);
    params.append(static_cast<int>(*filter.status));
  }
  if (filter.workflow_type) {
    sql += " AND workflow_type=$" + std::to_string(next++);
    params.append(*filter.workflow_type);
  }
  if (after) {
    const auto ts = std::to_string(next++);
    const auto id = std::to_string(next++);
    sql += " AND (start_time_ms>$" + ts + " OR (start_time_ms=$" + ts + " AND run_id>$" + id + "))";
    params.append(static_cast<int64_t>(after->start_time_ms));
    params.append(after->run_id);
  }
  sql += " ORDER BY start_time_ms ASC, run_id ASC";
  if (limit > 0) sql += " LIMIT " + std::to_string(limit);

  return Collect<model::ExecutionRecord>(TX(t).Work().exec_params(sql, params), ReadExecution);
}

std::vector<model::ExecutionRecord> PgRepository::ListOpenExecutions(Transaction& t) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kExecutionColumns +
                                          " FROM executions WHERE status=$1 AND NOT halted;",
                                      static_cast<int>(flowstead::core::v1::WORKFLOW_STATUS_RUNNING));
  return Collect<model::ExecutionRecord>(res, ReadExecution);
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result PgRepository::AppendEvents(Transaction& t, const std::string& workflow_id, const std::string& run_id,
                                  int64_t expected_seq, std::vector<model::EventRecord>& events) {
  try {
    auto& work = TX(t).Work();

    const auto length = work.exec_prepared1("count_events", workflow_id, run_id)[0].as<int64_t>();
    if (length != expected_seq) {
      return Result::Err(ErrorCode::Conflict,
                         "expected seq " + std::to_string(expected_seq) + ", log length " + std::to_string(length));
    }

    int64_t next_seq = expected_seq;
    for (auto& e : events) {
      e.workflow_id = workflow_id;
      e.run_id      = run_id;
      e.seq         = next_seq++;
      work.exec_prepared("append_event", e.workflow_id, e.run_id, e.seq, e.event_type,
                         static_cast<int64_t>(e.timestamp_ms), Bytes(e.payload));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadEvents(Transaction& t, const std::string& workflow_id,
                                                         const std::string& run_id, int64_t from_seq) {
  auto res = TX(t).Work().exec_prepared("read_events", workflow_id, run_id, from_seq);
  return Collect<model::EventRecord>(res, [](const pqxx::row& row) {
    model::EventRecord e;
    e.workflow_id  = Text(row[0]);
    e.run_id       = Text(row[1]);
    e.seq          = row[2].as<int64_t>();
    e.event_type   = row[3].as<int32_t>();
    e.timestamp_ms = static_cast<uint64_t>(row[4].as<int64_t>());
    e.payload      = Blob(row[5]);
    return e;
  });
}

int64_t PgRepository::CountEvents(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
  return TX(t).Work().exec_prepared1("count_events", workflow_id, run_id)[0].as<int64_t>();
}

// ------------------------------------------------------------------
// Inbox
// ------------------------------------------------------------------

Result PgRepository::InsertInbox(Transaction& t, model::InboxRecord& r) {
  try {
    auto row = TX(t).Work().exec_prepared1("insert_inbox", r.workflow_id, r.run_id,
                                           static_cast<int64_t>(r.created_at_ms), Bytes(r.payload));
    r.id = static_cast<uint64_t>(row[0].as<int64_t>());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::InboxRecord> PgRepository::ListInbox(Transaction& t, const std::string& workflow_id,
                                                        const std::string& run_id) {
  auto res = TX(t).Work().exec_prepared("list_inbox", workflow_id, run_id);
  return Collect<model::InboxRecord>(res, [](const pqxx::row& row) {
    model::InboxRecord r;
    r.id            = static_cast<uint64_t>(row[0].as<int64_t>());
    r.workflow_id   = Text(row[1]);
    r.run_id        = Text(row[2]);
    r.created_at_ms = static_cast<uint64_t>(row[3].as<int64_t>());
    r.payload       = Blob(row[4]);
    return r;
  });
}

Result PgRepository::DeleteInbox(Transaction& t, uint64_t id) {
  try {
    TX(t).Work().exec_params("DELETE FROM inbox WHERE id=$1;", static_cast<int64_t>(id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Run locks
// ------------------------------------------------------------------

std::optional<model::RunLockRecord>
PgRepository::GetRunLock(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
  auto& work = TX(t).Work();
  // lock the execution row first: a missing run_locks row cannot be locked,
  // and two holders must not both see it absent
  work.exec_params("SELECT 1 FROM executions WHERE workflow_id=$1 AND run_id=$2 FOR UPDATE;", workflow_id, run_id);

  auto res = work.exec_prepared("get_run_lock", workflow_id, run_id);
  if (res.empty()) return std::nullopt;

  model::RunLockRecord r;
  r.workflow_id     = Text(res[0][0]);
  r.run_id          = Text(res[0][1]);
  r.holder_id       = Text(res[0][2]);
  r.lease_expiry_ms = static_cast<uint64_t>(res[0][3].as<int64_t>());
  r.ttl_ms          = static_cast<uint64_t>(res[0][4].as<int64_t>());
  return r;
}

Result PgRepository::UpsertRunLock(Transaction& t, const model::RunLockRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_run_lock", r.workflow_id, r.run_id, r.holder_id,
                               static_cast<int64_t>(r.lease_expiry_ms), static_cast<int64_t>(r.ttl_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRunLock(Transaction& t, const std::string& workflow_id, const std::string& run_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM run_locks WHERE workflow_id=$1 AND run_id=$2;", workflow_id, run_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Activity tasks
// ------------------------------------------------------------------

Result PgRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO activity_tasks(") + kTaskColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11);",
                             TaskParams(r));
    return Result::Ok();
  } catch (const pqxx::unique_violation&) {
    return Result::Err(ErrorCode::AlreadyExists, r.task_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& task_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns +
                                          " FROM activity_tasks WHERE task_id=$1 FOR UPDATE;",
                                      task_id);
  if (res.empty()) return std::nullopt;
  return ReadTask(res[0]);
}

Result PgRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE activity_tasks SET task_queue=$2,workflow_id=$3,run_id=$4,command_id=$5,attempt=$6,"
        "visible_at_ms=$7,lease_owner=$8,lease_expiry_ms=$9,schedule_to_start_deadline_ms=$10,payload=$11 "
        "WHERE task_id=$1;",
        TaskParams(r));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.task_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteTask(Transaction& t, const std::string& task_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM activity_tasks WHERE task_id=$1;", task_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TaskRecord> PgRepository::ListVisibleTasks(Transaction& t, const std::string& task_queue,
                                                              uint64_t now_ms, std::size_t limit) {
  // SKIP LOCKED lets concurrent pollers on other connections take different tasks
  std::string sql = std::string("SELECT ") + kTaskColumns +
                    " FROM activity_tasks WHERE task_queue=$1 AND lease_expiry_ms=0 AND visible_at_ms<=$2"
                    " ORDER BY visible_at_ms ASC, task_id ASC";
  if (limit > 0) sql += " LIMIT " + std::to_string(limit);
  sql += " FOR UPDATE SKIP LOCKED;";

  auto res = TX(t).Work().exec_params(sql, task_queue, static_cast<int64_t>(now_ms));
  return Collect<model::TaskRecord>(res, ReadTask);
}

std::vector<model::TaskRecord> PgRepository::ListExpiredTasks(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kTaskColumns +
          " FROM activity_tasks WHERE (lease_expiry_ms<>0 AND lease_expiry_ms<=$1)"
          " OR (lease_expiry_ms=0 AND schedule_to_start_deadline_ms<>0 AND schedule_to_start_deadline_ms<=$1)"
          " FOR UPDATE SKIP LOCKED;",
      static_cast<int64_t>(now_ms));
  return Collect<model::TaskRecord>(res, ReadTask);
}

std::vector<model::TaskRecord> PgRepository::ListTasksForRun(Transaction& t, const std::string& workflow_id,
                                                             const std::string& run_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns +
                                          " FROM activity_tasks WHERE workflow_id=$1 AND run_id=$2;",
                                      workflow_id, run_id);
  return Collect<model::TaskRecord>(res, ReadTask);
}

// ------------------------------------------------------------------
// Timers
// ------------------------------------------------------------------

Result PgRepository::InsertTimer(Transaction& t, const model::TimerRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO timers(workflow_id,run_id,command_id,timer_id,fire_at_ms) VALUES($1,$2,$3,$4,$5);",
                             r.workflow_id, r.run_id, r.command_id, r.timer_id, static_cast<int64_t>(r.fire_at_ms));
    return Result::Ok();
  } catch (const pqxx::unique_violation&) {
    return Result::Err(ErrorCode::AlreadyExists, r.timer_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TimerRecord> PgRepository::ListDueTimers(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT workflow_id,run_id,command_id,timer_id,fire_at_ms FROM timers WHERE fire_at_ms<=$1 ORDER BY fire_at_ms ASC;",
      static_cast<int64_t>(now_ms));
  return Collect<model::TimerRecord>(res, ReadTimer);
}

std::vector<model::TimerRecord> PgRepository::ListTimersForRun(Transaction& t, const std::string& workflow_id,
                                                               const std::string& run_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT workflow_id,run_id,command_id,timer_id,fire_at_ms FROM timers WHERE workflow_id=$1 AND run_id=$2;",
      workflow_id, run_id);
  return Collect<model::TimerRecord>(res, ReadTimer);
}

Result PgRepository::DeleteTimer(Transaction& t, const std::string& workflow_id, const std::string& run_id,
                                 int64_t command_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM timers WHERE workflow_id=$1 AND run_id=$2 AND command_id=$3;", workflow_id,
                             run_id, command_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace flowstead::db::postgres
