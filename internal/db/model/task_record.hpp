#pragma once

#include <cstdint>
#include <string>

namespace flowstead::db::model {

/*
  TaskQueue entry. A task with lease_expiry_ms == 0 is pending and becomes
  deliverable at visible_at_ms; otherwise it is leased to lease_owner.
*/
struct TaskRecord {
  std::string task_id;
  std::string task_queue;
  std::string workflow_id;
  std::string run_id;
  int64_t     command_id = 0;
  int32_t     attempt    = 1;

  uint64_t    visible_at_ms = 0;
  std::string lease_owner;
  uint64_t    lease_expiry_ms = 0;

  uint64_t schedule_to_start_deadline_ms = 0; // 0 = unbounded

  std::string payload; // serialized runtime::v1::ActivityTask
};

} // namespace flowstead::db::model
