#include "time.hpp"

namespace flowstead::util {

TimePoint SystemClock::Now() const {
  return std::chrono::system_clock::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::Advance(Millis delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

void ManualClock::Set(TimePoint tp) {
  std::lock_guard lock(mutex_);
  now_ = tp;
}

TimePoint Now() {
  return std::chrono::system_clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

google::protobuf::Duration ToProto(Millis d) {
  google::protobuf::Duration out;
  out.set_seconds(d.count() / 1000);
  out.set_nanos(static_cast<int32_t>((d.count() % 1000) * 1000000));
  return out;
}

Millis FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Millis>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(Millis(ms));
}

} // namespace flowstead::util
