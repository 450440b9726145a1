// File: include/somni/service/presence_service.hpp
#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "somni/core/config.hpp"
#include "somni/core/status.hpp"
#include "somni/core/types.hpp"
#include "somni/core/util/local_clock.hpp"
#include "somni/day/day_boundary_resolver.hpp"
#include "somni/events/event_sink.hpp"
#include "somni/presence/presence_monitor.hpp"
#include "somni/sleep/sleep_wake_recorder.hpp"
#include "somni/store/telemetry_store.hpp"

namespace somni {

// PresenceService owns the pipeline for one store:
//   idle sample -> monitor -> store -> {recorder, resolver} -> queries.
//
// Threading:
//  - start/tick/record_* are serialized by an internal mutex (one driver thread expected).
//  - queries may come from any thread; they read a consistent state copy or the store.
//  - the day-start callback runs on the driving thread after the lock is released,
//    so it may call back into the service.
//
// The journal sink is optional and not owned.
class PresenceService {
 public:
  PresenceService(Config cfg, TelemetryStore& store, LocalClock clock, EventSink* sink = nullptr,
                  SleepStatementParser parser = literal_sleep_statement);

  PresenceService(const PresenceService&) = delete;
  PresenceService& operator=(const PresenceService&) = delete;

  void set_day_start_callback(DayStartCallback cb);

  // Restores the monitor and resolves cold start vs restart. Call once before tick().
  Status start(TimestampNs now);

  // One poll. A failed or malformed idle sample holds the last state (degraded signal).
  // Storage failures are returned. A presence transition is retried by the next poll;
  // sleep and interruption segments that failed to write are kept and retried first thing
  // on every later tick.
  Result<PresenceState> tick(const Result<double>& idle_seconds, TimestampNs now);

  // Runs the statement parser, then records every interval it produced.
  Result<std::size_t> record_statement(TimestampNs start, std::optional<TimestampNs> end, const std::string& text);
  Result<std::size_t> record_intervals(const std::vector<StatedInterval>& intervals);

  [[nodiscard]] PresenceState get_presence_state() const;

  PresenceStatistics get_presence_statistics(TimestampNs day_start, TimestampNs now) const;

  // Since the resolved day start, or the trailing lookback when none is known.
  PresenceStatistics get_presence_statistics(TimestampNs now) const;

  // Segments touching [now - lookback, now]; ongoing segments close at now.
  ReconciledNight get_reconciled_night(TimestampNs now) const;

  // Drops presence events older than the retention window.
  Result<std::size_t> prune(TimestampNs now);

  [[nodiscard]] std::optional<TimestampNs> day_start() const;

  // Away spans and interruptions still waiting for a successful write.
  [[nodiscard]] std::size_t unrecorded_count() const;
  [[nodiscard]] const LocalClock& clock() const noexcept { return clock_; }

 private:
  Status handle_transition_(const PresenceState& before, const PresenceState& after, TimestampNs now);
  Status record_away_(const AwayInterval& away);
  Status retry_unrecorded_();
  void journal_(const std::string& type, TimestampNs t, const std::string& message,
                std::optional<double> minutes = std::nullopt);
  void fire_day_starts_(std::vector<TimestampNs> wakes);

  Config cfg_;
  TelemetryStore& store_;
  LocalClock clock_;
  EventSink* sink_;
  SleepStatementParser parser_;

  SleepWakeRecorder recorder_;
  DayBoundaryResolver resolver_;
  PresenceMonitor monitor_;

  mutable std::mutex mu_;
  PresenceState state_;
  bool started_{false};
  std::vector<TimestampNs> pending_day_starts_;
  std::vector<AwayInterval> unrecorded_aways_;

  std::mutex cb_mu_;
  DayStartCallback on_day_start_;
};

}  // namespace somni
