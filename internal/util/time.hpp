#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include <google/protobuf/duration.pb.h>

namespace labelq::util {

/*
  Time utilities. Single place to control the clock source.

  Components that reason about lease expiry take a NowFn so tests can
  drive time explicitly.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

} // namespace labelq::util
