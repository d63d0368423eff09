#include "internal/orchestrator/join.hpp"

#include <stdexcept>

namespace flowstead::orchestrator {

using flowstead::core::v1::JoinPolicy;

namespace {

bool AllResolved(const std::vector<ChildState>& children) {
  for (const auto& child : children) {
    if (!child.resolved) return false;
  }
  return true;
}

} // namespace

JoinDecision EvaluateJoin(JoinPolicy policy, const std::vector<ChildState>& children) {
  JoinDecision decision;

  switch (policy) {
    case flowstead::core::v1::JOIN_POLICY_COLLECT_ALL:
      decision.ready = AllResolved(children);
      return decision;

    case flowstead::core::v1::JOIN_POLICY_FAIL_FAST: {
      for (std::size_t i = 0; i < children.size(); ++i) {
        const auto& child = children[i];
        if (!child.resolved || !child.failed) continue;
        if (!decision.failed_index || child.outcome_seq < children[*decision.failed_index].outcome_seq) {
          decision.failed_index = i;
        }
      }

      if (!decision.failed_index) {
        decision.ready = AllResolved(children);
        return decision;
      }

      decision.ready        = true;
      const auto failed_seq = children[*decision.failed_index].outcome_seq;
      for (std::size_t i = 0; i < children.size(); ++i) {
        if (!children[i].resolved || children[i].outcome_seq > failed_seq) {
          decision.cancel.push_back(i);
        }
      }
      return decision;
    }

    default:
      throw std::invalid_argument("join policy must be FAIL_FAST or COLLECT_ALL");
  }
}

} // namespace flowstead::orchestrator
