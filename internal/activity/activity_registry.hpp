#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "flowstead/runtime/v1/task.pb.h"

namespace flowstead::activity {

// Read-only view of the task an activity is executing.
struct ActivityContext {
  const flowstead::runtime::v1::ActivityTask& task;

  int32_t Attempt() const {
    return task.attempt();
  }
};

// Throw util::NonRetryableActivityError to fail without retry; any other
// exception is reported retryable.
using ActivityFn = std::function<std::string(const ActivityContext&, const std::string& input)>;

/*
  Explicit activity type name -> implementation table, shared by the
  worker pool (which executes) and the task service (which validates
  worker registrations).
*/
class ActivityRegistry {
 public:
  void Register(const std::string& name, ActivityFn fn);

  // Throws util::NotFound.
  ActivityFn Lookup(const std::string& name) const;

  bool Contains(const std::string& name) const;

  // Throws util::NotFound naming every unknown type.
  void Validate(const std::vector<std::string>& names) const;

  std::vector<std::string> Names() const;

 private:
  mutable std::mutex                mutex_;
  std::map<std::string, ActivityFn> activities_;
};

} // namespace flowstead::activity
