#include "time.hpp"

#include <algorithm>

namespace scout::util {

TimePoint Now() {
  return Clock::now();
}

SteadyTimePoint SteadyNow() {
  return SteadyClock::now();
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
  return TimePoint{} + std::chrono::seconds(ts.seconds()) + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// ------------------------------------------------------------
// Deadline
// ------------------------------------------------------------

Deadline Deadline::After(std::chrono::milliseconds budget) {
  return At(SteadyNow() + std::max(budget, std::chrono::milliseconds::zero()));
}

Deadline Deadline::At(SteadyTimePoint when) {
  Deadline deadline;
  deadline.when_  = when;
  deadline.never_ = false;
  return deadline;
}

Deadline Deadline::Never() {
  return Deadline{};
}

bool Deadline::Expired() const {
  return !never_ && SteadyNow() >= when_;
}

std::chrono::milliseconds Deadline::Remaining() const {
  if (never_) {
    return std::chrono::milliseconds::max();
  }
  const auto now = SteadyNow();
  if (now >= when_) {
    return std::chrono::milliseconds::zero();
  }
  return ToMillis(when_ - now);
}

std::chrono::milliseconds Deadline::Clamp(std::chrono::milliseconds operation_timeout) const {
  return std::min(operation_timeout, Remaining());
}

Deadline Deadline::Min(const Deadline& other) const {
  if (never_) return other;
  if (other.never_) return *this;
  return when_ <= other.when_ ? *this : other;
}

} // namespace scout::util
