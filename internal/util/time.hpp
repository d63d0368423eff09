#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace flowstead::util {

/*
  Time utilities: single place to control clock source.

  Everything in the engine that compares against "now" (leases, task
  visibility, timers, timeouts) reads time through a Clock so tests can
  drive it deterministically.
*/

using TimePoint = std::chrono::system_clock::time_point;
using Millis    = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(24 * 365 * 50));

  TimePoint Now() const override;

  void Advance(Millis delta);
  void Set(TimePoint tp);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Duration ToProto(Millis d);
Millis                     FromProto(const google::protobuf::Duration& d);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace flowstead::util
