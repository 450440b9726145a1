// File: include/somni/store/memory_telemetry_store.hpp
#pragma once

#include <shared_mutex>
#include <vector>

#include "somni/store/telemetry_store.hpp"

namespace somni {

// Process-local store. Used by tests and by `storage.type: memory`.
// set_unavailable() simulates a storage outage for every subsequent call.
class MemoryTelemetryStore final : public TelemetryStore {
 public:
  MemoryTelemetryStore() = default;

  Status append_presence_event(const PresenceEvent& e) override;
  Result<std::vector<PresenceEvent>> presence_events_since(TimestampNs since) const override;
  Result<std::optional<PresenceEvent>> latest_presence_event() const override;
  Result<std::size_t> prune_presence_events_before(TimestampNs cutoff) override;

  Result<std::int64_t> append_sleep_segment(const SleepSegment& s) override;
  Result<std::int64_t> append_wake_segment(const WakeSegment& w) override;

  Result<std::vector<SleepSegment>> sleep_segments_overlapping(TimestampNs from,
                                                               TimestampNs to) const override;
  Result<std::vector<WakeSegment>> wake_segments_overlapping(TimestampNs from,
                                                             TimestampNs to) const override;

  void set_unavailable(bool unavailable);

 private:
  Status check_available_() const;

  mutable std::shared_mutex mu_;
  bool unavailable_{false};

  std::vector<PresenceEvent> presence_;
  std::vector<SleepSegment> sleep_;
  std::vector<WakeSegment> wake_;
  std::int64_t next_sleep_id_{1};
  std::int64_t next_wake_id_{1};
};

}  // namespace somni
