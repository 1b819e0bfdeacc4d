#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"

namespace streamgate::util {

/*
  Time utilities: single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock; tests substitute a manual one.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Whole seconds of a protobuf Duration (sub-second part is dropped).
std::chrono::seconds FromProto(const google::protobuf::Duration& d);
google::protobuf::Duration ToProto(std::chrono::seconds s);

} // namespace streamgate::util
