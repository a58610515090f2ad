#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace masterplan::util {

/*
  Time utilities, single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t millis);

// 2024-05-01T12:30:00.123Z
std::string ToIso8601(TimePoint tp);

// 20240501123000, used inside release ids.
std::string ToCompactStamp(TimePoint tp);

} // namespace masterplan::util
