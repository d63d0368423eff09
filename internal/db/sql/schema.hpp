#pragma once

#include <string>
#include <vector>

namespace flowstead::db::sql {

/*
  Bootstrap DDL, one statement per entry. Statements are idempotent and
  run at every startup by the composition root.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS executions ("
      " workflow_id TEXT NOT NULL, run_id TEXT NOT NULL, workflow_type TEXT NOT NULL, task_queue TEXT NOT NULL,"
      " input BLOB, status INTEGER NOT NULL, result BLOB, failure BLOB,"
      " parent_workflow_id TEXT, parent_run_id TEXT, parent_command_id INTEGER NOT NULL DEFAULT 0,"
      " start_time_ms INTEGER NOT NULL, close_time_ms INTEGER NOT NULL DEFAULT 0, run_deadline_ms INTEGER NOT NULL DEFAULT 0,"
      " history_length INTEGER NOT NULL DEFAULT 0, is_current INTEGER NOT NULL, halted INTEGER NOT NULL DEFAULT 0, halt_reason TEXT,"
      " continued_from_run_id TEXT, continued_as_run_id TEXT,"
      " PRIMARY KEY (workflow_id, run_id));",
      "CREATE INDEX IF NOT EXISTS executions_by_start ON executions(start_time_ms, run_id);",
      "CREATE INDEX IF NOT EXISTS executions_open ON executions(status, halted);",
      "CREATE TABLE IF NOT EXISTS history_events ("
      " workflow_id TEXT NOT NULL, run_id TEXT NOT NULL, seq INTEGER NOT NULL, event_type INTEGER NOT NULL,"
      " timestamp_ms INTEGER NOT NULL, payload BLOB NOT NULL,"
      " PRIMARY KEY (workflow_id, run_id, seq));",
      "CREATE TABLE IF NOT EXISTS inbox ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT, workflow_id TEXT NOT NULL, run_id TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL, payload BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS inbox_by_run ON inbox(workflow_id, run_id, id);",
      "CREATE TABLE IF NOT EXISTS run_locks ("
      " workflow_id TEXT NOT NULL, run_id TEXT NOT NULL, holder_id TEXT NOT NULL,"
      " lease_expiry_ms INTEGER NOT NULL, ttl_ms INTEGER NOT NULL,"
      " PRIMARY KEY (workflow_id, run_id));",
      "CREATE TABLE IF NOT EXISTS activity_tasks ("
      " task_id TEXT PRIMARY KEY, task_queue TEXT NOT NULL, workflow_id TEXT NOT NULL, run_id TEXT NOT NULL,"
      " command_id INTEGER NOT NULL, attempt INTEGER NOT NULL, visible_at_ms INTEGER NOT NULL,"
      " lease_owner TEXT, lease_expiry_ms INTEGER NOT NULL DEFAULT 0,"
      " schedule_to_start_deadline_ms INTEGER NOT NULL DEFAULT 0, payload BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS activity_tasks_visible ON activity_tasks(task_queue, lease_expiry_ms, visible_at_ms);",
      "CREATE INDEX IF NOT EXISTS activity_tasks_by_run ON activity_tasks(workflow_id, run_id);",
      "CREATE TABLE IF NOT EXISTS timers ("
      " workflow_id TEXT NOT NULL, run_id TEXT NOT NULL, command_id INTEGER NOT NULL, timer_id TEXT NOT NULL,"
      " fire_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY (workflow_id, run_id, command_id));",
      "CREATE INDEX IF NOT EXISTS timers_due ON timers(fire_at_ms);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS executions ("
      " workflow_id TEXT NOT NULL, run_id TEXT NOT NULL, workflow_type TEXT NOT NULL, task_queue TEXT NOT NULL,"
      " input BYTEA, status SMALLINT NOT NULL, result BYTEA, failure BYTEA,"
      " parent_workflow_id TEXT, parent_run_id TEXT, parent_command_id BIGINT NOT NULL DEFAULT 0,"
      " start_time_ms BIGINT NOT NULL, close_time_ms BIGINT NOT NULL DEFAULT 0, run_deadline_ms BIGINT NOT NULL DEFAULT 0,"
      " history_length BIGINT NOT NULL DEFAULT 0, is_current BOOLEAN NOT NULL, halted BOOLEAN NOT NULL DEFAULT FALSE, halt_reason TEXT,"
      " continued_from_run_id TEXT, continued_as_run_id TEXT,"
      " PRIMARY KEY (workflow_id, run_id));",
      "CREATE INDEX IF NOT EXISTS executions_by_start ON executions(start_time_ms, run_id);",
      "CREATE INDEX IF NOT EXISTS executions_open ON executions(status, halted);",
      "CREATE TABLE IF NOT EXISTS history_events ("
      " workflow_id TEXT NOT NULL, run_id TEXT NOT NULL, seq BIGINT NOT NULL, event_type INTEGER NOT NULL,"
      " timestamp_ms BIGINT NOT NULL, payload BYTEA NOT NULL,"
      " PRIMARY KEY (workflow_id, run_id, seq));",
      "CREATE TABLE IF NOT EXISTS inbox ("
      " id BIGSERIAL PRIMARY KEY, workflow_id TEXT NOT NULL, run_id TEXT NOT NULL,"
      " created_at_ms BIGINT NOT NULL, payload BYTEA NOT NULL);",
      "CREATE INDEX IF NOT EXISTS inbox_by_run ON inbox(workflow_id, run_id, id);",
      "CREATE TABLE IF NOT EXISTS run_locks ("
      " workflow_id TEXT NOT NULL, run_id TEXT NOT NULL, holder_id TEXT NOT NULL,"
      " lease_expiry_ms BIGINT NOT NULL, ttl_ms BIGINT NOT NULL,"
      " PRIMARY KEY (workflow_id, run_id));",
      "CREATE TABLE IF NOT EXISTS activity_tasks ("
      " task_id TEXT PRIMARY KEY, task_queue TEXT NOT NULL, workflow_id TEXT NOT NULL, run_id TEXT NOT NULL,"
      " command_id BIGINT NOT NULL, attempt INTEGER NOT NULL, visible_at_ms BIGINT NOT NULL,"
      " lease_owner TEXT, lease_expiry_ms BIGINT NOT NULL DEFAULT 0,"
      " schedule_to_start_deadline_ms BIGINT NOT NULL DEFAULT 0, payload BYTEA NOT NULL);",
      "CREATE INDEX IF NOT EXISTS activity_tasks_visible ON activity_tasks(task_queue, lease_expiry_ms, visible_at_ms);",
      "CREATE INDEX IF NOT EXISTS activity_tasks_by_run ON activity_tasks(workflow_id, run_id);",
      "CREATE TABLE IF NOT EXISTS timers ("
      " workflow_id TEXT NOT NULL, run_id TEXT NOT NULL, command_id BIGINT NOT NULL, timer_id TEXT NOT NULL,"
      " fire_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY (workflow_id, run_id, command_id));",
      "CREATE INDEX IF NOT EXISTS timers_due ON timers(fire_at_ms);"};
  return kSchema;
}

} // namespace flowstead::db::sql
