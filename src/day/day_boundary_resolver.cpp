// File: src/day/day_boundary_resolver.cpp
#include "somni/day/day_boundary_resolver.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "somni/sleep/sleep_window.hpp"

namespace somni {

const char* to_string(DayBoundaryDecision d) {
  switch (d) {
    case DayBoundaryDecision::kNotADayStart: return "not_a_day_start";
    case DayBoundaryDecision::kAwaitingConfirmation: return "awaiting_confirmation";
    case DayBoundaryDecision::kConfirmedDayStart: return "confirmed_day_start";
  }
  return "unknown";
}

DayBoundaryResolver::DayBoundaryResolver(SleepWindowConfig window, LocalClock clock, TelemetryStore& store,
                                         SleepWakeRecorder& recorder, DayStartCallback on_day_start)
    : window_(std::move(window)),
      clock_(std::move(clock)),
      store_(store),
      recorder_(recorder),
      on_day_start_(std::move(on_day_start)) {}

Result<StartupResolution> DayBoundaryResolver::resolve_startup(TimestampNs now) {
  if (startup_) return Result<StartupResolution>::ok(*startup_);

  auto segs_r = store_.sleep_segments_overlapping(now.minus(kNsPerDay), now);
  if (!segs_r.ok()) return Result<StartupResolution>::err(segs_r.status());

  std::optional<TimestampNs> last_end;
  for (const auto& s : segs_r.value()) {
    if (!s.end || *s.end > now) continue;
    if (!last_end || *s.end > *last_end) last_end = s.end;
  }

  StartupResolution res;
  if (last_end) {
    res.kind = StartupKind::kRestart;
    res.day_start = *last_end;
    spdlog::info("restart: day started at {} (end of last recorded sleep)", clock_.format_local(*last_end));
  } else {
    // Today's typical wake, or yesterday's when it is still ahead of us.
    const TimestampNs wake = clock_.last_occurrence(now, window_.typical_wake);
    const TimestampNs bedtime = clock_.last_occurrence(wake, window_.start);

    auto seg_r = recorder_.record_user_stated_interval(bedtime, wake, "cold start: typical night assumed",
                                                       SegmentSource::kAssumedColdStart);
    if (!seg_r.ok()) return Result<StartupResolution>::err(seg_r.status());

    res.kind = StartupKind::kColdStart;
    res.day_start = wake;
    res.assumed_sleep = seg_r.take_value();
    spdlog::info("cold start: assuming sleep {} -> {}", clock_.format_local(bedtime), clock_.format_local(wake));
  }

  day_start_ = res.day_start;
  startup_ = res;
  if (res.kind == StartupKind::kColdStart && on_day_start_) on_day_start_(res.day_start);
  return Result<StartupResolution>::ok(res);
}

DayBoundaryDecision DayBoundaryResolver::on_away_return(TimestampNs away_start, TimestampNs away_end,
                                                        TimestampNs /*now*/) {
  if (minutes_between(away_start, away_end) < window_.real_wake_grace_minutes) {
    return DayBoundaryDecision::kNotADayStart;
  }
  if (!touches_sleep_window(away_start, away_end, window_, clock_)) {
    return DayBoundaryDecision::kNotADayStart;
  }
  if (day_start_ && clock_.last_occurrence(away_end, window_.start) <= *day_start_) {
    return DayBoundaryDecision::kNotADayStart;
  }

  if (!in_sleep_window(away_end, window_, clock_)) {
    confirm_(away_end);
    return DayBoundaryDecision::kConfirmedDayStart;
  }

  pending_wake_ = away_end;
  spdlog::info("possible wake at {}, waiting for the user to stay up", clock_.format_local(away_end));
  return DayBoundaryDecision::kAwaitingConfirmation;
}

bool DayBoundaryResolver::on_active_tick(TimestampNs now) {
  if (!pending_wake_) return false;

  const bool stayed_up = minutes_between(*pending_wake_, now) >= window_.real_wake_grace_minutes;
  if (!stayed_up && in_sleep_window(now, window_, clock_)) return false;

  const TimestampNs wake = *pending_wake_;
  pending_wake_.reset();
  confirm_(wake);
  return true;
}

Status DayBoundaryResolver::on_away_start(TimestampNs t) {
  if (!pending_wake_) return Status::ok_status();

  const TimestampNs wake = *pending_wake_;
  pending_wake_.reset();
  if (t <= wake) return Status::ok_status();

  spdlog::info("brief interruption {} -> {}, not a day start", clock_.format_local(wake), clock_.format_local(t));
  const Status st = record_interruption_(wake, t);
  if (!st.ok()) unrecorded_.emplace_back(wake, t);
  return st;
}

Status DayBoundaryResolver::retry_unrecorded() {
  while (!unrecorded_.empty()) {
    const auto [from, to] = unrecorded_.front();
    SOMNI_RETURN_IF_ERROR(record_interruption_(from, to));
    unrecorded_.erase(unrecorded_.begin());
  }
  return Status::ok_status();
}

Status DayBoundaryResolver::record_interruption_(TimestampNs from, TimestampNs to) {
  auto r = recorder_.record_wake_interval(from, to, "brief interruption", SegmentSource::kPresenceInferred);
  return r.status();
}

void DayBoundaryResolver::confirm_(TimestampNs wake_instant) {
  day_start_ = wake_instant;
  spdlog::info("day started at {}", clock_.format_local(wake_instant));
  if (on_day_start_) on_day_start_(wake_instant);
}

}  // namespace somni
