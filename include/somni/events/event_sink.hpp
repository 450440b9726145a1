// File: include/somni/events/event_sink.hpp
#pragma once

#include <optional>
#include <string>

#include "somni/core/status.hpp"
#include "somni/core/types.hpp"

namespace somni {

// Operational journal of what the daemon did (transitions, inferred sleep, day starts).
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  std::string config_path;
  std::string out_dir;
  std::string store;  // "sqlite:<path>" or "memory"
  TimestampNs start_time;
};

struct Event {
  std::string type;  // e.g. "run_started", "heartbeat", "confirmed_away", "day_start"
  TimestampNs timestamp;

  std::string message;            // optional human-readable hint
  std::optional<double> minutes;  // duration attached to the event, if any
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace somni
