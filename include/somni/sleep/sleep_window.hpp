// File: include/somni/sleep/sleep_window.hpp
#pragma once

#include "somni/core/config.hpp"
#include "somni/core/types.hpp"
#include "somni/core/util/local_clock.hpp"

namespace somni {

// [start, end) in minutes since local midnight. start > end wraps past midnight.
[[nodiscard]] constexpr bool in_sleep_window(int minute_of_day, const ClockTime& start, const ClockTime& end) {
  const int s = start.minutes_since_midnight();
  const int e = end.minutes_since_midnight();
  if (s > e) return minute_of_day >= s || minute_of_day < e;
  return minute_of_day >= s && minute_of_day < e;
}

[[nodiscard]] inline bool in_sleep_window(TimestampNs t, const SleepWindowConfig& window, const LocalClock& clock) {
  return in_sleep_window(clock.minutes_since_midnight(t), window.start, window.end);
}

// True when [from, to] touches the window: either end is inside, or a window opening falls between.
[[nodiscard]] inline bool touches_sleep_window(TimestampNs from, TimestampNs to, const SleepWindowConfig& window,
                                               const LocalClock& clock) {
  if (in_sleep_window(from, window, clock) || in_sleep_window(to, window, clock)) return true;
  return clock.last_occurrence(to, window.start) >= from;
}

}  // namespace somni
