#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/history/events.hpp"

namespace flowstead::history {

struct InboxEntry {
  uint64_t     id = 0;
  HistoryEvent event;
};

/*
  Durable per-run mailbox for events produced outside a decision cycle
  (activity outcomes, timer fires, signals, cancellation, child results,
  run timeouts). Entries carry an unsequenced HistoryEvent; the RunLock
  holder assigns seq when moving them into the EventLog.
*/
class Inbox {
 public:
  explicit Inbox(std::shared_ptr<db::Repository> repository);

  void Post(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key, const HistoryEvent& event);

  // Oldest first.
  std::vector<InboxEntry> List(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key);

  void Remove(db::Transaction& tx, uint64_t id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace flowstead::history
