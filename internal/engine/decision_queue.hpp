#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "flowstead/core/v1/types.pb.h"
#include "internal/util/time.hpp"

namespace flowstead::engine {

/*
  Runs waiting for a decision cycle.

  A run is queued at most once and handed to one thread at a time.
  Pushing a run that is in flight marks it dirty; Done() queues it
  again so nothing posted during the cycle is missed.
*/
class DecisionQueue {
 public:
  explicit DecisionQueue(std::shared_ptr<util::Clock> clock);

  void Push(const flowstead::core::v1::WorkflowExecutionKey& key, util::TimePoint not_before = {});

  // Blocks until a run is due or Shutdown().
  std::optional<flowstead::core::v1::WorkflowExecutionKey> Pop();

  std::optional<flowstead::core::v1::WorkflowExecutionKey> TryPop();

  void Done(const flowstead::core::v1::WorkflowExecutionKey& key);

  void Shutdown();

  std::size_t QueuedCount() const;

 private:
  struct Entry {
    flowstead::core::v1::WorkflowExecutionKey key;
    util::TimePoint                           not_before;
  };

  // Caller holds mutex_.
  std::optional<flowstead::core::v1::WorkflowExecutionKey> TakeDue();

  std::shared_ptr<util::Clock> clock_;

  mutable std::mutex           mutex_;
  std::condition_variable      cv_;
  std::map<std::string, Entry> queued_;
  std::set<std::string>        in_flight_;
  std::map<std::string, Entry> dirty_;
  bool                         shutdown_ = false;
};

} // namespace flowstead::engine
