// File: src/presence/presence_monitor.cpp
#include "somni/presence/presence_monitor.hpp"

#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

#include "somni/core/util/local_clock.hpp"

namespace somni {

PresenceMonitor::PresenceMonitor(PresenceConfig cfg, TelemetryStore& store)
    : cfg_(std::move(cfg)), store_(store) {}

Status PresenceMonitor::restore(TimestampNs now) {
  auto latest_r = store_.latest_presence_event();
  if (!latest_r.ok()) return latest_r.status();

  state_ = PresenceState{};
  state_.last_poll = now;
  newest_event_.reset();

  const auto& latest = latest_r.value();
  if (!latest) return Status::ok_status();

  newest_event_ = latest->timestamp;
  switch (latest->kind) {
    case PresenceEventKind::kConfirmedAway:
      state_.kind = PresenceStateKind::kConfirmedAway;
      state_.away_since = latest->timestamp;
      state_.grace_start = latest->timestamp;
      spdlog::info("resuming away span open since {}", format_iso8601_utc(latest->timestamp));
      break;
    case PresenceEventKind::kPotentiallyAway:
      state_.kind = PresenceStateKind::kPotentiallyAway;
      state_.grace_start = latest->timestamp;
      spdlog::info("resuming grace period open since {}", format_iso8601_utc(latest->timestamp));
      break;
    case PresenceEventKind::kReturned:
      state_.active_since = latest->timestamp;
      break;
  }
  return Status::ok_status();
}

Status PresenceMonitor::emit_(PresenceEventKind kind, TimestampNs ts, double idle_seconds,
                              double duration_minutes) {
  PresenceEvent e;
  e.timestamp = ts;
  e.kind = kind;
  e.idle_seconds = idle_seconds;
  e.duration_minutes = duration_minutes;

  const Status st = store_.append_presence_event(e);
  if (!st.ok()) {
    spdlog::error("failed to store {} event: {}", to_string(kind), st.message());
    return st;
  }
  newest_event_ = ts;
  spdlog::debug("presence event {} at {} (idle {:.1f}s)", to_string(kind), format_iso8601_utc(ts),
                idle_seconds);
  return Status::ok_status();
}

bool PresenceMonitor::idle_reset_(TimestampNs idle_start, double idle_seconds) const {
  if (idle_seconds < cfg_.return_threshold_s) return true;
  // Input happened between polls: idling restarted later than the span we are tracking.
  return state_.grace_start &&
         idle_start > state_.grace_start->plus(seconds_to_ns(cfg_.return_threshold_s));
}

Result<PresenceState> PresenceMonitor::poll(double idle_seconds, TimestampNs now) {
  if (!std::isfinite(idle_seconds) || idle_seconds < 0.0) {
    return Result<PresenceState>::err(Status::invalid_argument("idle_seconds must be finite and >= 0"));
  }

  if (degraded_) {
    spdlog::info("idle signal recovered");
    degraded_ = false;
  }
  state_.signal_degraded = false;
  state_.returned.reset();
  state_.idle_seconds = idle_seconds;
  state_.last_poll = now;

  const TimestampNs idle_start = now.minus(seconds_to_ns(idle_seconds));

  switch (state_.kind) {
    case PresenceStateKind::kActive: {
      if (!state_.active_since) state_.active_since = now;
      if (idle_seconds < cfg_.grace_threshold_s) break;

      TimestampNs grace_start = idle_start;
      if (newest_event_ && grace_start < *newest_event_) grace_start = *newest_event_;

      SOMNI_RETURN_IF_ERROR_R(PresenceState,
                              emit_(PresenceEventKind::kPotentiallyAway, grace_start, idle_seconds, 0.0));
      state_.kind = PresenceStateKind::kPotentiallyAway;
      state_.grace_start = grace_start;

      if (idle_seconds < cfg_.confirm_threshold_s) break;
      // Jumped straight past confirmation in one poll.
      SOMNI_RETURN_IF_ERROR_R(PresenceState,
                              emit_(PresenceEventKind::kConfirmedAway, grace_start, idle_seconds, 0.0));
      state_.kind = PresenceStateKind::kConfirmedAway;
      state_.away_since = grace_start;
      break;
    }

    case PresenceStateKind::kPotentiallyAway: {
      if (idle_seconds < cfg_.grace_threshold_s || idle_reset_(idle_start, idle_seconds)) {
        spdlog::debug("grace period ended without confirmation");
        state_.kind = PresenceStateKind::kActive;
        state_.grace_start.reset();
        state_.active_since = idle_start;
        break;
      }
      if (idle_seconds < cfg_.confirm_threshold_s) break;

      const TimestampNs grace_start = *state_.grace_start;
      SOMNI_RETURN_IF_ERROR_R(PresenceState,
                              emit_(PresenceEventKind::kConfirmedAway, grace_start, idle_seconds, 0.0));
      state_.kind = PresenceStateKind::kConfirmedAway;
      state_.away_since = grace_start;
      break;
    }

    case PresenceStateKind::kConfirmedAway: {
      if (!idle_reset_(idle_start, idle_seconds)) break;

      const TimestampNs away_since = *state_.away_since;
      const double minutes = minutes_between(away_since, now);
      SOMNI_RETURN_IF_ERROR_R(PresenceState,
                              emit_(PresenceEventKind::kReturned, now, idle_seconds, minutes));
      state_.kind = PresenceStateKind::kActive;
      state_.away_since.reset();
      state_.grace_start.reset();
      state_.active_since = now;
      state_.returned = AwayInterval{away_since, now};
      break;
    }
  }

  return Result<PresenceState>::ok(state_);
}

PresenceState PresenceMonitor::hold(TimestampNs now, const Status& why) {
  if (!degraded_) {
    spdlog::warn("idle signal degraded, holding {} state: {}", to_string(state_.kind), why.message());
    degraded_ = true;
  }
  state_.signal_degraded = true;
  state_.returned.reset();
  state_.last_poll = now;
  return state_;
}

PresenceState derive_presence_state(const std::vector<PresenceEvent>& events) {
  PresenceState s;
  for (const auto& e : events) {
    switch (e.kind) {
      case PresenceEventKind::kPotentiallyAway:
        s.kind = PresenceStateKind::kPotentiallyAway;
        s.grace_start = e.timestamp;
        s.away_since.reset();
        break;
      case PresenceEventKind::kConfirmedAway:
        s.kind = PresenceStateKind::kConfirmedAway;
        s.away_since = e.timestamp;
        if (!s.grace_start) s.grace_start = e.timestamp;
        break;
      case PresenceEventKind::kReturned:
        s.kind = PresenceStateKind::kActive;
        s.away_since.reset();
        s.grace_start.reset();
        s.active_since = e.timestamp;
        break;
    }
    s.idle_seconds = e.idle_seconds;
    s.last_poll = e.timestamp;
  }
  return s;
}

}  // namespace somni
