#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace tasktree::util {

/*
  Time utilities. Single place to control the clock source.

  Components that make time-based decisions (cache staleness, circuit
  breaker, embedding TTL) take a ClockFn so tests can drive time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t millis);

// RFC 3339, UTC.
std::string ToRfc3339(TimePoint tp);

} // namespace tasktree::util
