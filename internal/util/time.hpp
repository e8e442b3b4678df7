#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace kiosk::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable wall clock; quota and event stamping take one of these.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

// Local calendar date as "YYYY-MM-DD".
std::string LocalIsoDate(TimePoint tp);

bool IsIsoDate(const std::string& value);

} // namespace kiosk::util
