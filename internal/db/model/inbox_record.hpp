#pragma once

#include <cstdint>
#include <string>

namespace flowstead::db::model {

/*
  An event produced outside the run's decision cycle (activity outcome,
  signal, cancel, timer fire, child close). The RunLock holder moves it
  into history at its next decision.
*/
struct InboxRecord {
  uint64_t    id = 0; // assigned on insert
  std::string workflow_id;
  std::string run_id;
  uint64_t    created_at_ms = 0;
  std::string payload; // serialized history::v1::HistoryEvent, seq unset
};

} // namespace flowstead::db::model
