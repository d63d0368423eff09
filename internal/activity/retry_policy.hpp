#pragma once

#include <cstdint>

#include "flowstead/core/v1/types.pb.h"
#include "internal/util/time.hpp"

namespace flowstead::activity {

inline constexpr util::Millis kDefaultInitialInterval{1000};
inline constexpr double       kDefaultBackoffCoefficient = 2.0;
inline constexpr int          kDefaultMaximumIntervalFactor = 100;

// Fills unset fields: initial 1s, coefficient 2.0, maximum 100 x initial,
// maximum_attempts 0 (unlimited).
flowstead::core::v1::RetryPolicy WithDefaults(const flowstead::core::v1::RetryPolicy& policy);

// Delay before attempt + 1, given that `attempt` (1-based) just failed:
// min(initial * coefficient^(attempt-1), maximum).
util::Millis BackoffDelay(const flowstead::core::v1::RetryPolicy& policy, int32_t attempt);

bool IsNonRetryable(const flowstead::core::v1::RetryPolicy& policy, const flowstead::core::v1::Failure& failure);

bool ShouldRetry(const flowstead::core::v1::RetryPolicy& policy, int32_t attempt, const flowstead::core::v1::Failure& failure);

} // namespace flowstead::activity
