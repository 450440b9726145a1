// File: include/somni/day/day_boundary_resolver.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "somni/core/config.hpp"
#include "somni/core/status.hpp"
#include "somni/core/types.hpp"
#include "somni/core/util/local_clock.hpp"
#include "somni/sleep/sleep_wake_recorder.hpp"
#include "somni/store/telemetry_store.hpp"

namespace somni {

enum class DayBoundaryDecision {
  kNotADayStart,
  kAwaitingConfirmation,
  kConfirmedDayStart,
};

const char* to_string(DayBoundaryDecision d);

enum class StartupKind {
  kRestart,    // real sleep data in the trailing 24 h
  kColdStart,  // nothing known; a typical night was assumed
};

struct StartupResolution {
  StartupKind kind = StartupKind::kColdStart;
  TimestampNs day_start;
  std::optional<SleepSegment> assumed_sleep;  // set on cold start
};

// Receives the wake instant of every confirmed day start.
using DayStartCallback = std::function<void(TimestampNs wake_instant)>;

// Decides whether a return from a long gap starts a new day.
//
// Rules for on_away_return:
//  - away shorter than real_wake_grace                     -> NotADayStart
//  - away never touched the sleep window                   -> NotADayStart
//  - a day start is known and no window opened since then  -> NotADayStart
//  - return after the window closed                        -> ConfirmedDayStart (callback fires)
//  - return inside the window                              -> AwaitingConfirmation
// A pending wake confirms once the user stays active for real_wake_grace or the window closes.
// Going away again first turns the active stretch into a presence_inferred wake segment.
//
// Not thread-safe; the owning service serializes calls.
class DayBoundaryResolver {
 public:
  DayBoundaryResolver(SleepWindowConfig window, LocalClock clock, TelemetryStore& store,
                      SleepWakeRecorder& recorder, DayStartCallback on_day_start = {});

  // Runs once per process; later calls return the latched result.
  Result<StartupResolution> resolve_startup(TimestampNs now);

  DayBoundaryDecision on_away_return(TimestampNs away_start, TimestampNs away_end, TimestampNs now);

  // Returns true when this tick confirmed a pending wake.
  bool on_active_tick(TimestampNs now);

  // The user went away again at t. Cancels a pending wake (recording it as an interruption).
  // A failed write is kept and retried by retry_unrecorded().
  Status on_away_start(TimestampNs t);

  // Writes interruptions whose first write failed, oldest first; stops at the first failure.
  Status retry_unrecorded();
  [[nodiscard]] std::size_t unrecorded_count() const noexcept { return unrecorded_.size(); }

  [[nodiscard]] std::optional<TimestampNs> day_start() const noexcept { return day_start_; }
  [[nodiscard]] std::optional<TimestampNs> pending_wake() const noexcept { return pending_wake_; }
  [[nodiscard]] bool startup_resolved() const noexcept { return startup_.has_value(); }

 private:
  void confirm_(TimestampNs wake_instant);
  Status record_interruption_(TimestampNs from, TimestampNs to);

  SleepWindowConfig window_;
  LocalClock clock_;
  TelemetryStore& store_;
  SleepWakeRecorder& recorder_;
  DayStartCallback on_day_start_;

  std::optional<StartupResolution> startup_;
  std::optional<TimestampNs> day_start_;
  std::optional<TimestampNs> pending_wake_;
  std::vector<std::pair<TimestampNs, TimestampNs>> unrecorded_;
};

}  // namespace somni
