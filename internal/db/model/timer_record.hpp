#pragma once

#include <cstdint>
#include <string>

namespace flowstead::db::model {

struct TimerRecord {
  std::string workflow_id;
  std::string run_id;
  int64_t     command_id = 0;
  std::string timer_id;
  uint64_t    fire_at_ms = 0;
};

} // namespace flowstead::db::model
