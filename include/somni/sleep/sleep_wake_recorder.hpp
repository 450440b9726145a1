// File: include/somni/sleep/sleep_wake_recorder.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "somni/core/config.hpp"
#include "somni/core/status.hpp"
#include "somni/core/types.hpp"
#include "somni/core/util/local_clock.hpp"
#include "somni/store/telemetry_store.hpp"

namespace somni {

// One structured range produced from a user's sleep statement.
struct StatedInterval {
  enum class Kind { kSleep, kWake };

  Kind kind = Kind::kSleep;
  TimestampNs start;
  std::optional<TimestampNs> end;
  double estimated_minutes = 0.0;  // wake only, when the user gave a duration instead of an end
  std::string notes;
};

// Turns a free-text statement plus its anchoring range into structured intervals.
// Natural-language parsing lives outside this library; callers inject it.
using SleepStatementParser = std::function<Result<std::vector<StatedInterval>>(
    TimestampNs start, std::optional<TimestampNs> end, const std::string& text)>;

// Default parser: the whole range is one sleep interval and the text is kept as its note.
Result<std::vector<StatedInterval>> literal_sleep_statement(TimestampNs start, std::optional<TimestampNs> end,
                                                            const std::string& text);

// Converts away spans and user statements into sleep/wake segments.
class SleepWakeRecorder {
 public:
  SleepWakeRecorder(SleepWindowConfig window, LocalClock clock, TelemetryStore& store);

  // Sleep iff long enough AND both endpoints fall inside the sleep window.
  [[nodiscard]] bool classifies_as_sleep(TimestampNs away_start, TimestampNs away_end) const;

  // Records a presence_inferred segment when the span classifies as sleep.
  Result<std::optional<SleepSegment>> classify_and_record(TimestampNs away_start, TimestampNs away_end);

  // Unfiltered: user statements are never second-guessed by the classifier.
  // end unset records an ongoing segment.
  Result<SleepSegment> record_user_stated_interval(TimestampNs start, std::optional<TimestampNs> end,
                                                   std::string note = {},
                                                   SegmentSource source = SegmentSource::kUserStated);

  Result<WakeSegment> record_wake_interval(TimestampNs start, std::optional<TimestampNs> end,
                                           std::string notes = {},
                                           SegmentSource source = SegmentSource::kUserStated,
                                           double estimated_minutes = 0.0);

  // Records every interval in order; stops at the first failure.
  // Returns the number of segments written.
  Result<std::size_t> record_statement(const std::vector<StatedInterval>& intervals);

  [[nodiscard]] const SleepWindowConfig& window() const noexcept { return window_; }
  [[nodiscard]] const LocalClock& clock() const noexcept { return clock_; }

 private:
  SleepWindowConfig window_;
  LocalClock clock_;
  TelemetryStore& store_;
};

}  // namespace somni
