#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace scout::util {

/*
  Time utilities. Single place to control the clock source.

  Wall-clock time (system_clock) is only used for reporting.
  Budgets and deadlines run on the steady clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint Now();
SteadyTimePoint SteadyNow();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

template <typename Duration>
std::chrono::milliseconds ToMillis(Duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

/*
  Absolute point on the steady clock after which work must stop.

  A default-constructed deadline never expires.
*/
class Deadline {
 public:
  Deadline() = default;

  static Deadline After(std::chrono::milliseconds budget);
  static Deadline At(SteadyTimePoint when);
  static Deadline Never();

  bool Expired() const;
  bool IsNever() const {
    return never_;
  }

  // Zero once expired.
  std::chrono::milliseconds Remaining() const;

  // min(operation timeout, remaining budget)
  std::chrono::milliseconds Clamp(std::chrono::milliseconds operation_timeout) const;

  // The earlier of the two.
  Deadline Min(const Deadline& other) const;

  SteadyTimePoint When() const {
    return when_;
  }

 private:
  SteadyTimePoint when_{SteadyTimePoint::max()};
  bool            never_{true};
};

} // namespace scout::util
