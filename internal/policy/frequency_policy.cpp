#include "frequency_policy.hpp"

#include <chrono>

namespace docsync::policy {

namespace {

bool Elapsed(util::TimePoint last, util::TimePoint now, std::chrono::hours interval) {
  // Clock behind the recorded sync counts as stale.
  if (now < last) {
    return true;
  }
  return now - last > interval;
}

} // namespace

std::optional<Cadence> ParseCadence(std::string_view name) {
  if (name == "hourly") return Cadence::Hourly;
  if (name == "daily") return Cadence::Daily;
  if (name == "on_startup") return Cadence::OnStartup;
  if (name == "never") return Cadence::Never;
  return std::nullopt;
}

std::string_view CadenceName(Cadence cadence) {
  switch (cadence) {
    case Cadence::Hourly:
      return "hourly";
    case Cadence::Daily:
      return "daily";
    case Cadence::OnStartup:
      return "on_startup";
    case Cadence::Never:
      return "never";
  }
  return "unknown";
}

bool NeedsUpdate(Cadence cadence, const std::optional<util::TimePoint>& last_sync_time, bool checkout_exists, util::TimePoint now,
                 bool synced_this_run) {
  if (!checkout_exists) {
    return true;
  }

  if (!last_sync_time) {
    return true;
  }

  switch (cadence) {
    case Cadence::OnStartup:
      return !synced_this_run;
    case Cadence::Hourly:
      return Elapsed(*last_sync_time, now, std::chrono::hours(1));
    case Cadence::Daily:
      return Elapsed(*last_sync_time, now, std::chrono::hours(24));
    case Cadence::Never:
      return false;
  }

  return false;
}

} // namespace docsync::policy
