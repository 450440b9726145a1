// File: src/stats/presence_statistics.cpp
#include "somni/stats/presence_statistics.hpp"

#include <algorithm>
#include <optional>

namespace somni {

PresenceStatistics compute_presence_statistics(const std::vector<PresenceEvent>& events, TimestampNs day_start,
                                               TimestampNs now) {
  PresenceStatistics stats;
  if (now <= day_start) return stats;

  std::optional<TimestampNs> away_since;
  std::optional<TimestampNs> last_return;

  const auto add_away = [&](TimestampNs a, TimestampNs b) {
    a = std::max(a, day_start);
    b = std::min(b, now);
    if (b <= a) return;
    const double m = minutes_between(a, b);
    stats.total_away_minutes += m;
    stats.longest_away_minutes = std::max(stats.longest_away_minutes, m);
    ++stats.away_count;
  };

  for (const auto& e : events) {
    if (e.timestamp > now) break;
    switch (e.kind) {
      case PresenceEventKind::kPotentiallyAway:
        break;
      case PresenceEventKind::kConfirmedAway:
        if (!away_since) away_since = e.timestamp;
        break;
      case PresenceEventKind::kReturned: {
        const TimestampNs start = away_since ? *away_since : e.timestamp.minus(minutes_to_ns(e.duration_minutes));
        add_away(start, e.timestamp);
        away_since.reset();
        last_return = e.timestamp;
        break;
      }
    }
  }

  if (away_since) {
    add_away(*away_since, now);
    stats.current_away_minutes = minutes_between(*away_since, now);
  } else {
    const TimestampNs session_start = last_return ? std::max(*last_return, day_start) : day_start;
    stats.current_session_minutes = minutes_between(session_start, now);
  }

  stats.total_active_minutes = std::max(0.0, minutes_between(day_start, now) - stats.total_away_minutes);
  return stats;
}

}  // namespace somni
