#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace docsync::util {

/*
  Time utilities. Single place to control the clock source.

  Sync markers store Unix seconds as a floating-point value.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

double    ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(double seconds);

// Parses a bare decimal timestamp, surrounding whitespace allowed. Values
// outside the clock's range are rejected.
std::optional<TimePoint> ParseUnixSeconds(std::string_view text);

} // namespace docsync::util
