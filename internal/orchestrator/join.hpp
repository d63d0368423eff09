#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "flowstead/core/v1/types.pb.h"

namespace flowstead::orchestrator {

// What the parent's history says about one joined child.
struct ChildState {
  bool    resolved    = false;
  bool    failed      = false;
  int64_t outcome_seq = -1;
};

struct JoinDecision {
  bool ready = false;

  // FailFast only: the child whose failure has the lowest seq.
  std::optional<std::size_t> failed_index;

  // Children whose outcome was not recorded before that failure.
  std::vector<std::size_t> cancel;
};

/*
  Decides whether a join over `children` (in fan-out order) can resume.

    COLLECT_ALL: ready once every child is resolved.
    FAIL_FAST:   ready at the first recorded failure, or once every child
                 completed.

  The decision depends only on recorded seqs, so replaying a longer
  history returns the same answer. JOIN_POLICY_UNSPECIFIED throws
  std::invalid_argument.
*/
JoinDecision EvaluateJoin(flowstead::core::v1::JoinPolicy policy, const std::vector<ChildState>& children);

} // namespace flowstead::orchestrator
