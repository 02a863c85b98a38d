#include "time.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

namespace docsync::util {

namespace {

// Largest value FromUnixSeconds can convert without overflowing Clock::duration.
const double kMaxUnixSeconds = std::chrono::duration<double>(Clock::duration::max()).count();

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

double ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(double seconds) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

std::optional<TimePoint> ParseUnixSeconds(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  const auto last = text.find_last_not_of(" \t\r\n");

  const std::string trimmed(text.substr(first, last - first + 1));
  char*             endptr = nullptr;
  errno                    = 0;
  const double seconds     = std::strtod(trimmed.c_str(), &endptr);
  if (errno != 0 || endptr == trimmed.c_str() || *endptr != '\0' || !std::isfinite(seconds) || seconds < 0 ||
      seconds >= kMaxUnixSeconds) {
    return std::nullopt;
  }

  return FromUnixSeconds(seconds);
}

} // namespace docsync::util
