#pragma once

#include <functional>
#include <memory>

#include "flowstead/core/v1/types.pb.h"
#include "flowstead/history/v1/history.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/history/inbox.hpp"
#include "internal/util/time.hpp"

namespace flowstead::timer {

/*
  Durable timers. A TimerStarted decision stores a row with its fire
  time; the engine sweep turns due rows into TimerFired inbox entries.
  A timer fires exactly once: the row is deleted in the same
  transaction that posts the event.
*/
class TimerService {
 public:
  using WakeFn = std::function<void(const flowstead::core::v1::WorkflowExecutionKey&)>;

  TimerService(std::shared_ptr<db::Repository> repository, std::shared_ptr<history::Inbox> inbox,
               std::shared_ptr<util::Clock> clock);

  void SetWakeCallback(WakeFn wake);

  void Schedule(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                const flowstead::history::v1::TimerStartedAttributes& started);

  void CancelForRun(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key);

  // Returns the number of timers fired.
  std::size_t FireDue();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<history::Inbox> inbox_;
  std::shared_ptr<util::Clock>    clock_;
  WakeFn                          wake_;
};

} // namespace flowstead::timer
