// File: src/sleep/sleep_wake_recorder.cpp
#include "somni/sleep/sleep_wake_recorder.hpp"

#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

#include "somni/sleep/sleep_window.hpp"

namespace somni {

Result<std::vector<StatedInterval>> literal_sleep_statement(TimestampNs start, std::optional<TimestampNs> end,
                                                            const std::string& text) {
  StatedInterval iv;
  iv.kind = StatedInterval::Kind::kSleep;
  iv.start = start;
  iv.end = end;
  iv.notes = text;
  return Result<std::vector<StatedInterval>>::ok({iv});
}

SleepWakeRecorder::SleepWakeRecorder(SleepWindowConfig window, LocalClock clock, TelemetryStore& store)
    : window_(std::move(window)), clock_(std::move(clock)), store_(store) {}

bool SleepWakeRecorder::classifies_as_sleep(TimestampNs away_start, TimestampNs away_end) const {
  if (minutes_between(away_start, away_end) < window_.min_sleep_minutes) return false;
  return in_sleep_window(away_start, window_, clock_) && in_sleep_window(away_end, window_, clock_);
}

Result<std::optional<SleepSegment>> SleepWakeRecorder::classify_and_record(TimestampNs away_start,
                                                                           TimestampNs away_end) {
  using R = Result<std::optional<SleepSegment>>;
  if (away_end < away_start) {
    return R::err(Status::invalid_argument("away span ends before it starts"));
  }
  if (!classifies_as_sleep(away_start, away_end)) {
    spdlog::debug("away {} -> {} ({:.0f} min) is not sleep", clock_.format_local(away_start),
                  clock_.format_local(away_end), minutes_between(away_start, away_end));
    return R::ok(std::nullopt);
  }

  SleepSegment seg;
  seg.start = away_start;
  seg.end = away_end;
  seg.source = SegmentSource::kPresenceInferred;

  auto id_r = store_.append_sleep_segment(seg);
  if (!id_r.ok()) return R::err(id_r.status());
  seg.id = id_r.value();

  spdlog::info("inferred sleep {} -> {} ({:.0f} min)", clock_.format_local(away_start),
               clock_.format_local(away_end), seg.duration_minutes());
  return R::ok(std::move(seg));
}

Result<SleepSegment> SleepWakeRecorder::record_user_stated_interval(TimestampNs start,
                                                                    std::optional<TimestampNs> end,
                                                                    std::string note, SegmentSource source) {
  if (end && *end <= start) {
    return Result<SleepSegment>::err(Status::invalid_argument("sleep interval must end after it starts"));
  }

  SleepSegment seg;
  seg.start = start;
  seg.end = end;
  seg.source = source;
  seg.raw_note = std::move(note);

  auto id_r = store_.append_sleep_segment(seg);
  if (!id_r.ok()) return Result<SleepSegment>::err(id_r.status());
  seg.id = id_r.value();
  spdlog::info("recorded {} sleep from {}{}", to_string(source), clock_.format_local(start),
               end ? " to " + clock_.format_local(*end) : std::string(" (ongoing)"));
  return Result<SleepSegment>::ok(std::move(seg));
}

Result<WakeSegment> SleepWakeRecorder::record_wake_interval(TimestampNs start, std::optional<TimestampNs> end,
                                                            std::string notes, SegmentSource source,
                                                            double estimated_minutes) {
  if (end && *end <= start) {
    return Result<WakeSegment>::err(Status::invalid_argument("wake interval must end after it starts"));
  }
  if (!std::isfinite(estimated_minutes) || estimated_minutes < 0.0) {
    return Result<WakeSegment>::err(Status::invalid_argument("estimated_minutes must be finite and >= 0"));
  }

  WakeSegment seg;
  seg.start = start;
  seg.end = end;
  seg.estimated_minutes = end ? 0.0 : estimated_minutes;
  seg.source = source;
  seg.notes = std::move(notes);

  auto id_r = store_.append_wake_segment(seg);
  if (!id_r.ok()) return Result<WakeSegment>::err(id_r.status());
  seg.id = id_r.value();
  spdlog::info("recorded {} wake at {} ({:.0f} min{})", to_string(source), clock_.format_local(start),
               seg.duration_minutes(), seg.is_estimated() ? ", estimated" : "");
  return Result<WakeSegment>::ok(std::move(seg));
}

Result<std::size_t> SleepWakeRecorder::record_statement(const std::vector<StatedInterval>& intervals) {
  std::size_t written = 0;
  for (const auto& iv : intervals) {
    if (iv.kind == StatedInterval::Kind::kSleep) {
      auto r = record_user_stated_interval(iv.start, iv.end, iv.notes);
      if (!r.ok()) return Result<std::size_t>::err(r.status());
    } else {
      auto r = record_wake_interval(iv.start, iv.end, iv.notes, SegmentSource::kUserStated, iv.estimated_minutes);
      if (!r.ok()) return Result<std::size_t>::err(r.status());
    }
    ++written;
  }
  return Result<std::size_t>::ok(written);
}

}  // namespace somni
