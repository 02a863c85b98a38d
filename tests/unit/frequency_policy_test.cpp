#include "internal/policy/frequency_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using docsync::policy::Cadence;
using docsync::policy::CadenceName;
using docsync::policy::NeedsUpdate;
using docsync::policy::ParseCadence;
using docsync::util::TimePoint;

constexpr auto kEpsilon = std::chrono::milliseconds(1);

TimePoint Base() {
  return TimePoint{} + std::chrono::hours(24 * 365 * 50);
}

void TestParseAcceptsKnownNamesOnly() {
  assert(ParseCadence("hourly") == Cadence::Hourly);
  assert(ParseCadence("daily") == Cadence::Daily);
  assert(ParseCadence("on_startup") == Cadence::OnStartup);
  assert(ParseCadence("never") == Cadence::Never);

  assert(!ParseCadence("weekly").has_value());
  assert(!ParseCadence("Daily").has_value());
  assert(!ParseCadence("").has_value());

  for (auto cadence : {Cadence::Hourly, Cadence::Daily, Cadence::OnStartup, Cadence::Never}) {
    assert(ParseCadence(CadenceName(cadence)) == cadence);
  }
}

void TestMissingCheckoutAlwaysNeedsUpdate() {
  const auto now = Base();
  for (auto cadence : {Cadence::Hourly, Cadence::Daily, Cadence::OnStartup, Cadence::Never}) {
    assert(NeedsUpdate(cadence, std::nullopt, false, now, false));
    assert(NeedsUpdate(cadence, now, false, now, true));
    assert(NeedsUpdate(cadence, now - std::chrono::seconds(1), false, now, true));
  }
}

void TestNeverSyncedNeedsUpdate() {
  const auto now = Base();
  for (auto cadence : {Cadence::Hourly, Cadence::Daily, Cadence::OnStartup, Cadence::Never}) {
    assert(NeedsUpdate(cadence, std::nullopt, true, now, false));
  }
}

void TestHourlyBoundary() {
  const auto now = Base();
  assert(!NeedsUpdate(Cadence::Hourly, now - std::chrono::minutes(59), true, now, true));
  assert(!NeedsUpdate(Cadence::Hourly, now - std::chrono::hours(1), true, now, true));
  assert(NeedsUpdate(Cadence::Hourly, now - std::chrono::hours(1) - kEpsilon, true, now, true));
}

void TestDailyBoundary() {
  const auto now = Base();
  assert(!NeedsUpdate(Cadence::Daily, now - std::chrono::hours(23), true, now, true));
  assert(!NeedsUpdate(Cadence::Daily, now - std::chrono::hours(24), true, now, true));
  assert(NeedsUpdate(Cadence::Daily, now - std::chrono::hours(24) - kEpsilon, true, now, true));
}

void TestNinetyMinutesAgo() {
  const auto now  = Base();
  const auto last = now - std::chrono::minutes(90);
  assert(NeedsUpdate(Cadence::Hourly, last, true, now, false));
  assert(!NeedsUpdate(Cadence::Daily, last, true, now, false));
}

void TestOnStartupIsOncePerProcess() {
  const auto now  = Base();
  const auto last = now - std::chrono::minutes(5);

  // Marker left by an earlier process: refetch once.
  assert(NeedsUpdate(Cadence::OnStartup, last, true, now, false));
  assert(!NeedsUpdate(Cadence::OnStartup, last, true, now, true));
  assert(!NeedsUpdate(Cadence::OnStartup, now - std::chrono::hours(24 * 30), true, now, true));
}

void TestNeverLeavesExistingCheckoutAlone() {
  const auto now = Base();
  assert(!NeedsUpdate(Cadence::Never, now - std::chrono::hours(24 * 400), true, now, false));
}

void TestClockBehindLastSyncIsStale() {
  const auto now = Base();
  assert(NeedsUpdate(Cadence::Hourly, now + std::chrono::minutes(10), true, now, true));
  assert(NeedsUpdate(Cadence::Daily, now + std::chrono::minutes(10), true, now, true));
  assert(!NeedsUpdate(Cadence::Never, now + std::chrono::minutes(10), true, now, true));
}

} // namespace

int main() {
  TestParseAcceptsKnownNamesOnly();
  TestMissingCheckoutAlwaysNeedsUpdate();
  TestNeverSyncedNeedsUpdate();
  TestHourlyBoundary();
  TestDailyBoundary();
  TestNinetyMinutesAgo();
  TestOnStartupIsOncePerProcess();
  TestNeverLeavesExistingCheckoutAlone();
  TestClockBehindLastSyncIsStale();

  std::cout << "docsync_unit_frequency_policy: pass\n";
  return 0;
}
