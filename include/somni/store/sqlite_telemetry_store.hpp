// File: include/somni/store/sqlite_telemetry_store.hpp
#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "somni/store/telemetry_store.hpp"

struct sqlite3;

namespace somni {

// SQLite-backed telemetry.
// Schema:
//  - presence_events(id PK, ts_ns, kind, idle_seconds, duration_minutes)   idx(ts_ns)
//  - sleep_segments(id PK, start_ns, end_ns NULL, duration_minutes NULL, source, raw_note)
//  - wake_segments(id PK, start_ns, end_ns NULL, estimated_minutes, source, notes)
//    both segment tables indexed on start_ns and end_ns.
//
// Notes:
//  * WAL journal so external readers (somni_ctl) do not block the daemon.
//  * One connection per instance, serialized by a mutex.
class SqliteTelemetryStore final : public TelemetryStore {
 public:
  explicit SqliteTelemetryStore(std::string db_path);
  ~SqliteTelemetryStore() override;

  SqliteTelemetryStore(const SqliteTelemetryStore&) = delete;
  SqliteTelemetryStore& operator=(const SqliteTelemetryStore&) = delete;

  // Call once after construction. Creates parent directories and the schema.
  Status open();
  void close();

  const std::string& path() const { return db_path_; }

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

 private:
  Status init_schema_();
  Status check_open_() const;

  struct DbCloser {
    void operator()(sqlite3* db) const;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbCloser> db_;
  mutable std::mutex mu_;
};

}  // namespace somni
