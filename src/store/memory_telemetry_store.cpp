// File: src/store/memory_telemetry_store.cpp
#include "somni/store/memory_telemetry_store.hpp"

#include <algorithm>
#include <mutex>

namespace somni {
namespace {

bool touches(TimestampNs start, const std::optional<TimestampNs>& end, TimestampNs from, TimestampNs to) {
  return start < to && (!end || *end >= from);
}

template <typename Seg>
void sort_by_start(std::vector<Seg>& v) {
  std::sort(v.begin(), v.end(), [](const Seg& a, const Seg& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.id < b.id;
  });
}

}  // namespace

void MemoryTelemetryStore::set_unavailable(bool unavailable) {
  std::unique_lock lock(mu_);
  unavailable_ = unavailable;
}

Status MemoryTelemetryStore::check_available_() const {
  if (unavailable_) return Status::unavailable("memory store marked unavailable");
  return Status::ok_status();
}

Status MemoryTelemetryStore::append_presence_event(const PresenceEvent& e) {
  std::unique_lock lock(mu_);
  SOMNI_RETURN_IF_ERROR(check_available_());
  if (!presence_.empty() && e.timestamp < presence_.back().timestamp) {
    return Status::invalid_argument("presence event older than the newest stored event");
  }
  presence_.push_back(e);
  return Status::ok_status();
}

Result<std::vector<PresenceEvent>> MemoryTelemetryStore::presence_events_since(TimestampNs since) const {
  std::shared_lock lock(mu_);
  const Status st = check_available_();
  if (!st.ok()) return Result<std::vector<PresenceEvent>>::err(st);

  std::vector<PresenceEvent> out;
  for (const auto& e : presence_) {
    if (e.timestamp >= since) out.push_back(e);
  }
  return Result<std::vector<PresenceEvent>>::ok(std::move(out));
}

Result<std::optional<PresenceEvent>> MemoryTelemetryStore::latest_presence_event() const {
  std::shared_lock lock(mu_);
  const Status st = check_available_();
  if (!st.ok()) return Result<std::optional<PresenceEvent>>::err(st);

  if (presence_.empty()) return Result<std::optional<PresenceEvent>>::ok(std::nullopt);
  return Result<std::optional<PresenceEvent>>::ok(presence_.back());
}

Result<std::size_t> MemoryTelemetryStore::prune_presence_events_before(TimestampNs cutoff) {
  std::unique_lock lock(mu_);
  const Status st = check_available_();
  if (!st.ok()) return Result<std::size_t>::err(st);

  const auto before = presence_.size();
  presence_.erase(std::remove_if(presence_.begin(), presence_.end(),
                                 [cutoff](const PresenceEvent& e) { return e.timestamp < cutoff; }),
                  presence_.end());
  return Result<std::size_t>::ok(before - presence_.size());
}

Result<std::int64_t> MemoryTelemetryStore::append_sleep_segment(const SleepSegment& s) {
  std::unique_lock lock(mu_);
  const Status st = check_available_();
  if (!st.ok()) return Result<std::int64_t>::err(st);
  if (s.end && *s.end < s.start) {
    return Result<std::int64_t>::err(Status::invalid_argument("sleep segment ends before it starts"));
  }

  SleepSegment copy = s;
  copy.id = next_sleep_id_++;
  sleep_.push_back(copy);
  return Result<std::int64_t>::ok(copy.id);
}

Result<std::int64_t> MemoryTelemetryStore::append_wake_segment(const WakeSegment& w) {
  std::unique_lock lock(mu_);
  const Status st = check_available_();
  if (!st.ok()) return Result<std::int64_t>::err(st);
  if (w.end && *w.end < w.start) {
    return Result<std::int64_t>::err(Status::invalid_argument("wake segment ends before it starts"));
  }

  WakeSegment copy = w;
  copy.id = next_wake_id_++;
  wake_.push_back(copy);
  return Result<std::int64_t>::ok(copy.id);
}

Result<std::vector<SleepSegment>> MemoryTelemetryStore::sleep_segments_overlapping(TimestampNs from,
                                                                                   TimestampNs to) const {
  std::shared_lock lock(mu_);
  const Status st = check_available_();
  if (!st.ok()) return Result<std::vector<SleepSegment>>::err(st);

  std::vector<SleepSegment> out;
  for (const auto& s : sleep_) {
    if (touches(s.start, s.end, from, to)) out.push_back(s);
  }
  sort_by_start(out);
  return Result<std::vector<SleepSegment>>::ok(std::move(out));
}

Result<std::vector<WakeSegment>> MemoryTelemetryStore::wake_segments_overlapping(TimestampNs from,
                                                                                 TimestampNs to) const {
  std::shared_lock lock(mu_);
  const Status st = check_available_();
  if (!st.ok()) return Result<std::vector<WakeSegment>>::err(st);

  std::vector<WakeSegment> out;
  for (const auto& w : wake_) {
    if (touches(w.start, w.effective_end(), from, to)) out.push_back(w);
  }
  sort_by_start(out);
  return Result<std::vector<WakeSegment>>::ok(std::move(out));
}

}  // namespace somni
