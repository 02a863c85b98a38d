#pragma once

#include <optional>
#include <string_view>

#include "internal/util/time.hpp"

namespace docsync::policy {

enum class Cadence {
  Hourly,
  Daily,
  OnStartup,
  Never,
};

// Accepts exactly "hourly", "daily", "on_startup", "never".
std::optional<Cadence> ParseCadence(std::string_view name);
std::string_view       CadenceName(Cadence cadence);

/*
  Staleness decision for one source.

  Rules, first match wins:
    checkout missing           -> update
    never synced               -> update
    on_startup                 -> update until a sync succeeded in this process
    hourly / daily             -> update once strictly more than 1h / 24h elapsed,
                                  or when the clock is behind last_sync_time
    never                      -> no update
*/
bool NeedsUpdate(Cadence cadence, const std::optional<util::TimePoint>& last_sync_time, bool checkout_exists, util::TimePoint now,
                 bool synced_this_run);

} // namespace docsync::policy
