// File: src/core/types.cpp
#include "somni/core/types.hpp"

namespace somni {

const char* to_string(PresenceEventKind kind) {
  switch (kind) {
    case PresenceEventKind::kPotentiallyAway: return "potentially_away";
    case PresenceEventKind::kConfirmedAway: return "confirmed_away";
    case PresenceEventKind::kReturned: return "returned";
  }
  return "unknown";
}

const char* to_string(PresenceStateKind kind) {
  switch (kind) {
    case PresenceStateKind::kActive: return "active";
    case PresenceStateKind::kPotentiallyAway: return "potentially_away";
    case PresenceStateKind::kConfirmedAway: return "confirmed_away";
  }
  return "unknown";
}

const char* to_string(SegmentSource source) {
  switch (source) {
    case SegmentSource::kUserStated: return "user_stated";
    case SegmentSource::kPresenceInferred: return "presence_inferred";
    case SegmentSource::kAssumedColdStart: return "assumed_cold_start";
  }
  return "unknown";
}

const char* to_string(SleepQuality quality) {
  switch (quality) {
    case SleepQuality::kNone: return "none";
    case SleepQuality::kPoor: return "poor";
    case SleepQuality::kFair: return "fair";
    case SleepQuality::kGood: return "good";
  }
  return "unknown";
}

Result<PresenceEventKind> parse_presence_event_kind(const std::string& s) {
  if (s == "potentially_away") return Result<PresenceEventKind>::ok(PresenceEventKind::kPotentiallyAway);
  if (s == "confirmed_away") return Result<PresenceEventKind>::ok(PresenceEventKind::kConfirmedAway);
  if (s == "returned") return Result<PresenceEventKind>::ok(PresenceEventKind::kReturned);
  return Result<PresenceEventKind>::err(Status::parse_error("unknown presence event kind: " + s));
}

Result<SegmentSource> parse_segment_source(const std::string& s) {
  if (s == "user_stated") return Result<SegmentSource>::ok(SegmentSource::kUserStated);
  if (s == "presence_inferred") return Result<SegmentSource>::ok(SegmentSource::kPresenceInferred);
  if (s == "assumed_cold_start") return Result<SegmentSource>::ok(SegmentSource::kAssumedColdStart);
  return Result<SegmentSource>::err(Status::parse_error("unknown segment source: " + s));
}

}  // namespace somni
