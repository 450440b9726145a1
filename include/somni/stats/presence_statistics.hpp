// File: include/somni/stats/presence_statistics.hpp
#pragma once

#include <vector>

#include "somni/core/types.hpp"

namespace somni {

// Active/away accounting over [day_start, now].
//
// `events` is the chronological presence stream; it may begin before day_start so that an
// away span already open at day_start is found (and clipped to it).
// Away spans run from ConfirmedAway to Returned; a grace period alone is not away time.
// A Returned whose ConfirmedAway was pruned is reconstructed from its duration_minutes.
PresenceStatistics compute_presence_statistics(const std::vector<PresenceEvent>& events, TimestampNs day_start,
                                               TimestampNs now);

}  // namespace somni
