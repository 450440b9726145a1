// File: include/somni/store/telemetry_store.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "somni/core/status.hpp"
#include "somni/core/types.hpp"

namespace somni {

// Append-only telemetry: presence transitions plus sleep/wake intervals.
//
// Contract:
//  - Nothing is edited in place. Superseded sleep data is excluded at reconcile time.
//  - Presence events are non-decreasing in timestamp; an older append is rejected
//    with invalid_argument.
//  - Writes report failures (callers must not drop telemetry silently).
//  - Implementations are safe for one writer plus concurrent readers.
class TelemetryStore {
 public:
  virtual ~TelemetryStore() = default;

  // --- presence events
  virtual Status append_presence_event(const PresenceEvent& e) = 0;

  // Events with timestamp >= since, oldest first.
  virtual Result<std::vector<PresenceEvent>> presence_events_since(TimestampNs since) const = 0;

  virtual Result<std::optional<PresenceEvent>> latest_presence_event() const = 0;

  // Retention; returns the number of events removed.
  virtual Result<std::size_t> prune_presence_events_before(TimestampNs cutoff) = 0;

  // --- sleep / wake segments (id is assigned here; the input id is ignored)
  virtual Result<std::int64_t> append_sleep_segment(const SleepSegment& s) = 0;
  virtual Result<std::int64_t> append_wake_segment(const WakeSegment& w) = 0;

  // Segments intersecting [from, to). Ongoing segments count as open-ended.
  // Ordered by start, then id.
  virtual Result<std::vector<SleepSegment>> sleep_segments_overlapping(TimestampNs from,
                                                                       TimestampNs to) const = 0;
  virtual Result<std::vector<WakeSegment>> wake_segments_overlapping(TimestampNs from,
                                                                     TimestampNs to) const = 0;
};

}  // namespace somni
