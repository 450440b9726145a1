// File: include/somni/core/types.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "somni/core/status.hpp"

namespace somni {

// -----------------------------
// Time
// -----------------------------
// Instants are integer nanoseconds since the Unix epoch, UTC. Conversions to local
// clock time live in LocalClock; nothing in this header knows about time zones.

using DurationNs = std::int64_t;

constexpr DurationNs kNsPerSecond = 1'000'000'000;
constexpr DurationNs kNsPerMinute = 60 * kNsPerSecond;
constexpr DurationNs kNsPerHour = 60 * kNsPerMinute;
constexpr DurationNs kNsPerDay = 24 * kNsPerHour;

constexpr DurationNs seconds_to_ns(double seconds) {
  return static_cast<DurationNs>(seconds * 1'000'000'000.0);
}

constexpr DurationNs minutes_to_ns(double minutes) {
  return static_cast<DurationNs>(minutes * 60'000'000'000.0);
}

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }

  [[nodiscard]] constexpr TimestampNs plus(DurationNs d) const noexcept { return TimestampNs{ns + d}; }
  [[nodiscard]] constexpr TimestampNs minus(DurationNs d) const noexcept { return TimestampNs{ns - d}; }
};

// Signed; callers clamp where a negative span is meaningless.
constexpr double minutes_between(TimestampNs from, TimestampNs to) {
  return static_cast<double>(to.ns - from.ns) / static_cast<double>(kNsPerMinute);
}

// -----------------------------
// Presence telemetry
// -----------------------------

enum class PresenceEventKind {
  kPotentiallyAway,
  kConfirmedAway,
  kReturned,
};

struct PresenceEvent {
  TimestampNs timestamp;
  PresenceEventKind kind = PresenceEventKind::kPotentiallyAway;

  // Idle time observed by the probe when the event was produced.
  double idle_seconds = 0.0;

  // Only meaningful on kReturned: minutes since the matching away start.
  double duration_minutes = 0.0;
};

enum class PresenceStateKind {
  kActive,
  kPotentiallyAway,
  kConfirmedAway,
};

// Closed away span, [start, end).
struct AwayInterval {
  TimestampNs start;
  TimestampNs end;

  [[nodiscard]] double duration_minutes() const { return minutes_between(start, end); }
};

// Derived presence state. Never persisted; rebuilt from the newest events on restart.
struct PresenceState {
  PresenceStateKind kind = PresenceStateKind::kActive;

  // Set while kConfirmedAway: the backdated start of the away span.
  std::optional<TimestampNs> away_since;

  // Set while kPotentiallyAway or kConfirmedAway: when idling first began.
  std::optional<TimestampNs> grace_start;

  // Start of the current active stretch (first poll, or last return).
  std::optional<TimestampNs> active_since;

  double idle_seconds = 0.0;
  TimestampNs last_poll;

  // True while the idle probe keeps failing and the state is being held.
  bool signal_degraded = false;

  // Only set on the poll that produced a kReturned event.
  std::optional<AwayInterval> returned;

  [[nodiscard]] bool is_away() const noexcept { return kind == PresenceStateKind::kConfirmedAway; }
};

// -----------------------------
// Sleep / wake telemetry
// -----------------------------

enum class SegmentSource {
  kUserStated,
  kPresenceInferred,
  kAssumedColdStart,
};

// User data always wins over system data during reconciliation.
[[nodiscard]] constexpr bool is_system_source(SegmentSource s) noexcept {
  return s != SegmentSource::kUserStated;
}

struct SleepSegment {
  std::int64_t id = 0;  // assigned by the store
  TimestampNs start;
  std::optional<TimestampNs> end;  // unset while ongoing
  SegmentSource source = SegmentSource::kPresenceInferred;
  std::string raw_note;

  [[nodiscard]] bool is_ongoing() const noexcept { return !end.has_value(); }

  // Derived from start/end; 0 while ongoing.
  [[nodiscard]] double duration_minutes() const {
    return end ? minutes_between(start, *end) : 0.0;
  }
};

// Wakefulness nested inside a sleep window (a bathroom break, a 3am phone check).
struct WakeSegment {
  std::int64_t id = 0;  // assigned by the store
  TimestampNs start;
  std::optional<TimestampNs> end;

  // Used only when end is unset: "I was up for about 20 minutes".
  double estimated_minutes = 0.0;

  SegmentSource source = SegmentSource::kUserStated;
  std::string notes;

  [[nodiscard]] bool is_estimated() const noexcept { return !end.has_value() && estimated_minutes > 0.0; }

  [[nodiscard]] std::optional<TimestampNs> effective_end() const {
    if (end) return end;
    if (estimated_minutes > 0.0) return start.plus(minutes_to_ns(estimated_minutes));
    return std::nullopt;
  }

  [[nodiscard]] double duration_minutes() const {
    const auto e = effective_end();
    return e ? minutes_between(start, *e) : 0.0;
  }
};

// -----------------------------
// Derived summaries
// -----------------------------

struct SleepPeriod {
  TimestampNs start;
  TimestampNs end;
  SegmentSource source = SegmentSource::kPresenceInferred;  // dominant source by minutes
  bool primary = false;                                      // longest period of the night

  [[nodiscard]] double duration_minutes() const { return minutes_between(start, end); }
};

struct WakeInterruption {
  TimestampNs start;
  TimestampNs end;
  SegmentSource source = SegmentSource::kUserStated;
  std::string notes;
  bool estimated = false;

  [[nodiscard]] double duration_minutes() const { return minutes_between(start, end); }
};

enum class SleepQuality {
  kNone,
  kPoor,
  kFair,
  kGood,
};

struct ReconciledNight {
  double total_sleep_minutes = 0.0;
  double total_wake_minutes = 0.0;
  double primary_sleep_minutes = 0.0;
  double time_in_bed_minutes = 0.0;

  std::vector<SleepPeriod> sleep_periods;  // chronological, non-overlapping
  std::vector<WakeInterruption> wake_interruptions;

  bool fragmented = false;
  SleepQuality quality = SleepQuality::kNone;

  std::map<SegmentSource, double> source_breakdown;

  // System segments dropped because a user-stated segment overlapped them.
  int discarded_system_segments = 0;
};

struct PresenceStatistics {
  double total_active_minutes = 0.0;
  double total_away_minutes = 0.0;
  int away_count = 0;
  double longest_away_minutes = 0.0;
  double current_session_minutes = 0.0;  // 0 unless currently active
  double current_away_minutes = 0.0;     // 0 unless currently away
};

// -----------------------------
// Names (storage, journal, CLI)
// -----------------------------

const char* to_string(PresenceEventKind kind);
const char* to_string(PresenceStateKind kind);
const char* to_string(SegmentSource source);
const char* to_string(SleepQuality quality);

Result<PresenceEventKind> parse_presence_event_kind(const std::string& s);
Result<SegmentSource> parse_segment_source(const std::string& s);

}  // namespace somni
