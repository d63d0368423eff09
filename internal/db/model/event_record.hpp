#pragma once

#include <cstdint>
#include <string>

namespace flowstead::db::model {

struct EventRecord {
  std::string workflow_id;
  std::string run_id;
  int64_t     seq          = 0;
  int32_t     event_type   = 0;
  uint64_t    timestamp_ms = 0;
  std::string payload; // serialized history::v1::HistoryEvent
};

} // namespace flowstead::db::model
