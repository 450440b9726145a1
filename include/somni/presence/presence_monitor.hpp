// File: include/somni/presence/presence_monitor.hpp
#pragma once

#include <optional>
#include <vector>

#include "somni/core/config.hpp"
#include "somni/core/status.hpp"
#include "somni/core/types.hpp"
#include "somni/store/telemetry_store.hpp"

namespace somni {

// Active -> PotentiallyAway -> ConfirmedAway -> Active, driven by idle samples.
//
// Event timing:
//  - PotentiallyAway and ConfirmedAway are both stamped at grace_start (when idling began),
//    so the away span is backdated and the stream stays non-decreasing.
//  - Returned is stamped at the poll that saw the reset, with duration = now - away_since.
//
// A failed append leaves the state where it was; the same transition is retried next poll.
// Single writer: one monitor per store.
class PresenceMonitor {
 public:
  PresenceMonitor(PresenceConfig cfg, TelemetryStore& store);

  // Rebuilds state from the newest stored event (resume an away span left open by a restart).
  Status restore(TimestampNs now);

  Result<PresenceState> poll(double idle_seconds, TimestampNs now);

  // Idle probe failed: keep the last state, flag it degraded.
  PresenceState hold(TimestampNs now, const Status& why);

  [[nodiscard]] const PresenceState& state() const noexcept { return state_; }

 private:
  Status emit_(PresenceEventKind kind, TimestampNs ts, double idle_seconds, double duration_minutes);
  [[nodiscard]] bool idle_reset_(TimestampNs idle_start, double idle_seconds) const;

  PresenceConfig cfg_;
  TelemetryStore& store_;

  PresenceState state_;
  std::optional<TimestampNs> newest_event_;
  bool degraded_{false};
};

// Replays a stored event stream into the state it implies (no idle sample available).
// Used by read-only tools that do not own the monitor.
PresenceState derive_presence_state(const std::vector<PresenceEvent>& events);

}  // namespace somni
