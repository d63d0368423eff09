#include "internal/activity/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace flowstead::activity {

using flowstead::core::v1::Failure;
using flowstead::core::v1::RetryPolicy;

RetryPolicy WithDefaults(const RetryPolicy& policy) {
  RetryPolicy out = policy;

  auto initial = util::FromProto(policy.initial_interval());
  if (initial.count() <= 0) {
    initial                        = kDefaultInitialInterval;
    *out.mutable_initial_interval() = util::ToProto(initial);
  }
  if (policy.backoff_coefficient() < 1.0) {
    out.set_backoff_coefficient(kDefaultBackoffCoefficient);
  }
  if (util::FromProto(policy.maximum_interval()).count() <= 0) {
    *out.mutable_maximum_interval() = util::ToProto(initial * kDefaultMaximumIntervalFactor);
  }
  if (policy.maximum_attempts() < 0) {
    out.set_maximum_attempts(0);
  }
  return out;
}

util::Millis BackoffDelay(const RetryPolicy& policy, int32_t attempt) {
  const auto   effective = WithDefaults(policy);
  const double initial   = static_cast<double>(util::FromProto(effective.initial_interval()).count());
  const double maximum   = static_cast<double>(util::FromProto(effective.maximum_interval()).count());

  const double delay = initial * std::pow(effective.backoff_coefficient(), std::max(0, attempt - 1));
  return util::Millis(static_cast<int64_t>(std::min(delay, maximum)));
}

bool IsNonRetryable(const RetryPolicy& policy, const Failure& failure) {
  if (failure.non_retryable()) return true;

  const auto& types = policy.non_retryable_error_types();
  return std::find(types.begin(), types.end(), failure.type()) != types.end();
}

bool ShouldRetry(const RetryPolicy& policy, int32_t attempt, const Failure& failure) {
  if (IsNonRetryable(policy, failure)) return false;

  const auto max_attempts = policy.maximum_attempts();
  return max_attempts <= 0 || attempt < max_attempts;
}

} // namespace flowstead::activity
