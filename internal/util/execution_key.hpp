#pragma once

#include <string>

#include "flowstead/core/v1/types.pb.h"

namespace flowstead::util {

inline flowstead::core::v1::WorkflowExecutionKey MakeKey(const std::string& workflow_id, const std::string& run_id) {
  flowstead::core::v1::WorkflowExecutionKey key;
  key.set_workflow_id(workflow_id);
  key.set_run_id(run_id);
  return key;
}

// "<workflow_id>/<run_id>"; used in logs and as a map key.
inline std::string KeyString(const flowstead::core::v1::WorkflowExecutionKey& key) {
  return key.workflow_id() + "/" + key.run_id();
}

inline bool SameKey(const flowstead::core::v1::WorkflowExecutionKey& a, const flowstead::core::v1::WorkflowExecutionKey& b) {
  return a.workflow_id() == b.workflow_id() && a.run_id() == b.run_id();
}

} // namespace flowstead::util
