// File: include/somni/core/util/local_clock.hpp
#pragma once

#include <optional>
#include <string>

#include "somni/core/config.hpp"
#include "somni/core/status.hpp"
#include "somni/core/types.hpp"

namespace somni {

// Maps UTC instants onto the user's wall clock.
// Either follows the system zone (localtime_r, DST aware) or a fixed offset.
// Sleep-window tests compare minutes since local midnight, never bare hours.
class LocalClock {
 public:
  static LocalClock system_zone();
  static LocalClock fixed_offset(int utc_offset_minutes);
  static LocalClock from_config(const TimeZoneConfig& cfg);

  // Offset east of UTC in effect at t.
  [[nodiscard]] int utc_offset_minutes(TimestampNs t) const;

  // 0..1439
  [[nodiscard]] int minutes_since_midnight(TimestampNs t) const;

  // The instant at local clock time `ct` on the local calendar date of `ref`.
  [[nodiscard]] TimestampNs at_local_time(TimestampNs ref, const ClockTime& ct) const;

  // Most recent instant <= t whose local clock time is `ct`.
  [[nodiscard]] TimestampNs last_occurrence(TimestampNs t, const ClockTime& ct) const;

  [[nodiscard]] std::string format_local(TimestampNs t) const;  // "YYYY-MM-DD HH:MM"

 private:
  explicit LocalClock(std::optional<int> fixed_offset_min) : fixed_offset_min_(fixed_offset_min) {}

  std::optional<int> fixed_offset_min_;
};

// Wall clock "now" as epoch ns.
TimestampNs wall_now();

// "2026-01-19T07:00:00Z"; fractional seconds are dropped.
std::string format_iso8601_utc(TimestampNs t);

// Accepts "YYYY-MM-DDTHH:MM[:SS]" followed by "Z" or "+HH:MM" / "-HH:MM".
// A missing zone designator is read as UTC.
Result<TimestampNs> parse_iso8601(const std::string& text);

}  // namespace somni
