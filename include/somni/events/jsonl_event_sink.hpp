// File: include/somni/events/jsonl_event_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "somni/events/event_sink.hpp"
#include "somni/core/status.hpp"

namespace somni {

// JSONL sink for events.
// Writes every event line to:
//   1) a unique per-run file: events_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: events_latest.jsonl (truncated each run)
class JsonlEventSink final : public EventSink {
 public:
  JsonlEventSink() = default;
  ~JsonlEventSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const Event& e) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);

  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

// Deletes all but the newest `keep_last` per-run journals in out_dir (events_latest.jsonl is kept).
// Best-effort; returns the number of files removed.
std::size_t prune_event_journals(const std::string& out_dir, std::size_t keep_last);

// Minimal JSON string escaping for journal fields.
std::string json_escape(const std::string& s);

}  // namespace somni
