// File: src/service/presence_service.cpp
#include "somni/service/presence_service.hpp"

#include <cmath>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "somni/reconcile/reconciliation_engine.hpp"
#include "somni/stats/presence_statistics.hpp"

namespace somni {
namespace {

DurationNs hours_to_ns(double hours) { return static_cast<DurationNs>(hours * static_cast<double>(kNsPerHour)); }

}  // namespace

PresenceService::PresenceService(Config cfg, TelemetryStore& store, LocalClock clock, EventSink* sink,
                                 SleepStatementParser parser)
    : cfg_(std::move(cfg)),
      store_(store),
      clock_(std::move(clock)),
      sink_(sink),
      parser_(std::move(parser)),
      recorder_(cfg_.sleep_window, clock_, store_),
      resolver_(cfg_.sleep_window, clock_, store_, recorder_,
                [this](TimestampNs wake) {
                  // Runs under mu_ (inside start/tick); delivered once the lock is released.
                  pending_day_starts_.push_back(wake);
                  journal_("day_start", wake, clock_.format_local(wake));
                }),
      monitor_(cfg_.presence, store_) {}

void PresenceService::set_day_start_callback(DayStartCallback cb) {
  std::lock_guard<std::mutex> lock(cb_mu_);
  on_day_start_ = std::move(cb);
}

void PresenceService::journal_(const std::string& type, TimestampNs t, const std::string& message,
                               std::optional<double> minutes) {
  if (!sink_) return;
  Event e;
  e.type = type;
  e.timestamp = t;
  e.message = message;
  e.minutes = minutes;
  const Status st = sink_->emit(e);
  if (!st.ok()) spdlog::warn("journal write failed: {}", st.message());
}

void PresenceService::fire_day_starts_(std::vector<TimestampNs> wakes) {
  if (wakes.empty()) return;
  std::lock_guard<std::mutex> lock(cb_mu_);
  if (!on_day_start_) return;
  for (const TimestampNs t : wakes) on_day_start_(t);
}

Status PresenceService::start(TimestampNs now) {
  std::vector<TimestampNs> fired;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (started_) return Status::ok_status();

    SOMNI_RETURN_IF_ERROR(monitor_.restore(now));

    auto res_r = resolver_.resolve_startup(now);
    if (!res_r.ok()) return res_r.status();
    const StartupResolution& res = res_r.value();
    journal_("startup", now,
             std::string(res.kind == StartupKind::kRestart ? "restart" : "cold_start") +
                 ", day started " + clock_.format_local(res.day_start));

    state_ = monitor_.state();
    started_ = true;
    fired.swap(pending_day_starts_);
  }
  fire_day_starts_(std::move(fired));
  return Status::ok_status();
}

Result<PresenceState> PresenceService::tick(const Result<double>& idle_seconds, TimestampNs now) {
  std::vector<TimestampNs> fired;
  Status write_status;
  PresenceState out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!started_) {
      return Result<PresenceState>::err(Status::invalid_argument("PresenceService::tick called before start"));
    }

    write_status = retry_unrecorded_();

    const PresenceState before = monitor_.state();

    Status sample_status = idle_seconds.status();
    if (sample_status.ok() && (!std::isfinite(idle_seconds.value()) || idle_seconds.value() < 0.0)) {
      sample_status = Status::invalid_argument("malformed idle sample " + std::to_string(idle_seconds.value()));
    }

    if (!sample_status.ok()) {
      monitor_.hold(now, sample_status);
      if (!before.signal_degraded) journal_("signal_degraded", now, sample_status.message());
    } else {
      if (before.signal_degraded) journal_("signal_recovered", now, "");
      auto r = monitor_.poll(idle_seconds.value(), now);
      // Events committed before a failed append still drive their side effects.
      const Status st = handle_transition_(before, monitor_.state(), now);
      if (!r.ok()) {
        write_status = r.status();
      } else if (write_status.ok()) {
        write_status = st;
      }
    }

    state_ = monitor_.state();
    out = state_;
    fired.swap(pending_day_starts_);
  }
  fire_day_starts_(std::move(fired));

  if (!write_status.ok()) return Result<PresenceState>::err(write_status);
  return Result<PresenceState>::ok(out);
}

Status PresenceService::retry_unrecorded_() {
  while (!unrecorded_aways_.empty()) {
    const AwayInterval away = unrecorded_aways_.front();
    SOMNI_RETURN_IF_ERROR(record_away_(away));
    unrecorded_aways_.erase(unrecorded_aways_.begin());
    spdlog::info("recorded away span {} -> {} on retry", clock_.format_local(away.start),
                 clock_.format_local(away.end));
  }
  return resolver_.retry_unrecorded();
}

Status PresenceService::record_away_(const AwayInterval& away) {
  auto seg_r = recorder_.classify_and_record(away.start, away.end);
  if (!seg_r.ok()) return seg_r.status();
  if (seg_r.value()) {
    journal_("sleep_inferred", away.start, clock_.format_local(away.start) + " -> " + clock_.format_local(away.end),
             seg_r.value()->duration_minutes());
  }
  return Status::ok_status();
}

Status PresenceService::handle_transition_(const PresenceState& before, const PresenceState& after,
                                           TimestampNs now) {
  Status result;
  const bool was_active = before.kind == PresenceStateKind::kActive;

  if (was_active && after.kind != PresenceStateKind::kActive && after.grace_start) {
    journal_("potentially_away", *after.grace_start,
             "idle " + std::to_string(static_cast<int>(after.idle_seconds)) + "s");
  }

  if (before.kind != PresenceStateKind::kConfirmedAway && after.kind == PresenceStateKind::kConfirmedAway) {
    journal_("confirmed_away", *after.away_since, "");
    const Status st = resolver_.on_away_start(*after.away_since);
    if (!st.ok()) {
      spdlog::error("failed to record brief interruption, will retry: {}", st.message());
      result = st;
    }
  }

  if (before.kind == PresenceStateKind::kPotentiallyAway && after.kind == PresenceStateKind::kActive) {
    journal_("grace_cancelled", now, "");
  }

  if (after.returned) {
    const AwayInterval away = *after.returned;
    journal_("returned", now, "", away.duration_minutes());

    // Keep the order of away spans: a newer one waits behind an older unrecorded one.
    const Status st = unrecorded_aways_.empty() ? record_away_(away)
                                                : Status::unavailable("earlier away span not yet recorded");
    if (!st.ok()) {
      spdlog::error("failed to record away span, will retry: {}", st.message());
      unrecorded_aways_.push_back(away);
      if (result.ok()) result = st;
    }

    const DayBoundaryDecision d = resolver_.on_away_return(away.start, away.end, now);
    if (d != DayBoundaryDecision::kNotADayStart) journal_("day_boundary", now, to_string(d));
    return result;
  }

  if (after.kind == PresenceStateKind::kActive) resolver_.on_active_tick(now);
  return result;
}

Result<std::size_t> PresenceService::record_statement(TimestampNs start, std::optional<TimestampNs> end,
                                                      const std::string& text) {
  if (!parser_) return Result<std::size_t>::err(Status::internal("no sleep statement parser configured"));
  auto parsed = parser_(start, end, text);
  if (!parsed.ok()) return Result<std::size_t>::err(parsed.status());
  return record_intervals(parsed.value());
}

Result<std::size_t> PresenceService::record_intervals(const std::vector<StatedInterval>& intervals) {
  std::lock_guard<std::mutex> lock(mu_);
  auto r = recorder_.record_statement(intervals);
  if (r.ok() && r.value() > 0) {
    journal_("user_statement", intervals.front().start, std::to_string(r.value()) + " interval(s) recorded");
  }
  return r;
}

PresenceState PresenceService::get_presence_state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::optional<TimestampNs> PresenceService::day_start() const {
  std::lock_guard<std::mutex> lock(mu_);
  return resolver_.day_start();
}

std::size_t PresenceService::unrecorded_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return unrecorded_aways_.size() + resolver_.unrecorded_count();
}

PresenceStatistics PresenceService::get_presence_statistics(TimestampNs day_start, TimestampNs now) const {
  // Reach back far enough to find an away span already open at day_start.
  auto events_r = store_.presence_events_since(day_start.minus(hours_to_ns(cfg_.reconcile.lookback_hours)));
  if (!events_r.ok()) {
    spdlog::warn("presence statistics computed without events: {}", events_r.status().message());
    return compute_presence_statistics({}, day_start, now);
  }
  return compute_presence_statistics(events_r.value(), day_start, now);
}

PresenceStatistics PresenceService::get_presence_statistics(TimestampNs now) const {
  const auto ds = day_start();
  return get_presence_statistics(ds ? *ds : now.minus(hours_to_ns(cfg_.reconcile.lookback_hours)), now);
}

ReconciledNight PresenceService::get_reconciled_night(TimestampNs now) const {
  const TimestampNs from = now.minus(hours_to_ns(cfg_.reconcile.lookback_hours));

  std::vector<SleepSegment> sleep;
  auto sleep_r = store_.sleep_segments_overlapping(from, now);
  if (sleep_r.ok()) {
    sleep = sleep_r.take_value();
  } else {
    spdlog::warn("reconciling without sleep segments: {}", sleep_r.status().message());
  }

  std::vector<WakeSegment> wake;
  auto wake_r = store_.wake_segments_overlapping(from, now);
  if (wake_r.ok()) {
    wake = wake_r.take_value();
  } else {
    spdlog::warn("reconciling without wake segments: {}", wake_r.status().message());
  }

  return reconcile(sleep, wake, ReconcileOptions::from_config(cfg_.reconcile, now));
}

Result<std::size_t> PresenceService::prune(TimestampNs now) {
  const TimestampNs cutoff = now.minus(static_cast<DurationNs>(cfg_.storage.presence_retention_days) * kNsPerDay);
  auto r = store_.prune_presence_events_before(cutoff);
  if (r.ok()) {
    spdlog::info("pruned {} presence event(s) older than {}", r.value(), format_iso8601_utc(cutoff));
  }
  return r;
}

}  // namespace somni
