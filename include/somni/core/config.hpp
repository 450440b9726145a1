// File: include/somni/core/config.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "somni/core/status.hpp"
#include "somni/core/types.hpp"

namespace somni {

// Units policy:
// - Presence thresholds in seconds (they are compared against the idle probe)
// - Sleep/day thresholds in minutes
// - Clock times as local HH:MM

// -----------------------------
// Clock time of day
// -----------------------------
struct ClockTime {
  int hour = 0;
  int minute = 0;

  [[nodiscard]] constexpr int minutes_since_midnight() const noexcept { return hour * 60 + minute; }

  constexpr bool operator==(const ClockTime& other) const noexcept {
    return hour == other.hour && minute == other.minute;
  }
};

// Strict "HH:MM", 00:00..23:59.
Result<ClockTime> parse_hhmm(const std::string& text);
std::string format_hhmm(const ClockTime& t);

// -----------------------------
// Presence monitor
// -----------------------------
struct PresenceConfig {
  // Idle time that moves Active -> PotentiallyAway.
  double grace_threshold_s = 60.0;

  // Idle time that confirms the away span.
  double confirm_threshold_s = 180.0;

  // Idle below this counts as "reset to near zero" (user is back).
  double return_threshold_s = 5.0;
};

// -----------------------------
// Sleep window / day boundary
// -----------------------------
struct SleepWindowConfig {
  ClockTime start{22, 30};
  ClockTime end{9, 0};

  // Away spans shorter than this never classify as sleep.
  double min_sleep_minutes = 120.0;

  // Cold start assumes the user woke at this local time today.
  ClockTime typical_wake{7, 0};

  // A return must last (or the away must have lasted) this long to count as waking up.
  double real_wake_grace_minutes = 15.0;
};

// -----------------------------
// Reconciliation
// -----------------------------
struct ReconcileConfig {
  double lookback_hours = 24.0;

  // Quality grading thresholds (total net sleep).
  double good_minutes = 420.0;
  double fair_minutes = 360.0;

  // A split shorter than this (a mouse nudge at 3am) does not fragment the night.
  double merge_gap_minutes = 2.0;
};

// -----------------------------
// Time zone
// -----------------------------
struct TimeZoneConfig {
  // Fixed offset east of UTC. Unset means "use the system zone".
  std::optional<int> utc_offset_minutes;
};

// -----------------------------
// Storage
// -----------------------------
struct StorageConfig {
  std::string type = "sqlite";  // sqlite | memory
  std::string db_path = "somni.db";

  // Presence events older than this are pruned; sleep/wake segments are kept forever.
  int presence_retention_days = 30;
};

// -----------------------------
// Idle input
// -----------------------------
struct InputSynthConfig {
  // Deterministic pattern: active for active_s, then idle for away_s, repeat.
  double active_s = 600.0;
  double away_s = 300.0;

  // Simulated seconds per wall second; > 1 compresses a night into minutes.
  double time_scale = 1.0;
};

struct InputIdleFileConfig {
  std::string path;

  // A probe file older than this is treated as a stalled probe (0 disables).
  double max_age_s = 30.0;
};

struct InputConfig {
  std::string type = "synth";  // synth | idle_file
  double tick_hz = 0.2;        // one poll every 5 s
  int heartbeat_every_s = 300; // 0 disables
  std::int64_t max_ticks = 0;  // 0 disables
  double max_run_s = 0.0;      // 0 disables

  InputSynthConfig synth;
  InputIdleFileConfig idle_file;
};

// -----------------------------
// Output (journal) + logging
// -----------------------------
struct OutputConfig {
  // Where to write the JSONL event journal.
  std::string out_dir = "out";
};

struct LoggingConfig {
  std::string level = "info";  // trace | debug | info | warn | error | critical | off
  std::string file;            // optional; empty logs to stderr only
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  PresenceConfig presence;
  SleepWindowConfig sleep_window;
  ReconcileConfig reconcile;
  TimeZoneConfig timezone;
  StorageConfig storage;
  InputConfig input;
  OutputConfig output;
  LoggingConfig logging;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.presence.grace_threshold_s <= 0.0) {
    return Status::invalid_argument("presence.grace_threshold_s must be > 0");
  }
  if (cfg.presence.confirm_threshold_s < cfg.presence.grace_threshold_s) {
    return Status::invalid_argument("presence.confirm_threshold_s must be >= presence.grace_threshold_s");
  }
  if (cfg.presence.return_threshold_s <= 0.0 ||
      cfg.presence.return_threshold_s >= cfg.presence.grace_threshold_s) {
    return Status::invalid_argument("presence.return_threshold_s must be in (0, grace_threshold_s)");
  }
  if (cfg.sleep_window.start == cfg.sleep_window.end) {
    return Status::invalid_argument("sleep_window.start and sleep_window.end must differ");
  }
  if (cfg.sleep_window.min_sleep_minutes < 0.0) {
    return Status::invalid_argument("sleep_window.min_sleep_minutes must be >= 0");
  }
  if (cfg.sleep_window.real_wake_grace_minutes < 0.0) {
    return Status::invalid_argument("sleep_window.real_wake_grace_minutes must be >= 0");
  }
  if (cfg.reconcile.lookback_hours <= 0.0) {
    return Status::invalid_argument("reconcile.lookback_hours must be > 0");
  }
  if (cfg.reconcile.fair_minutes > cfg.reconcile.good_minutes) {
    return Status::invalid_argument("reconcile.fair_minutes must be <= reconcile.good_minutes");
  }
  if (cfg.reconcile.merge_gap_minutes < 0.0) {
    return Status::invalid_argument("reconcile.merge_gap_minutes must be >= 0");
  }
  if (cfg.timezone.utc_offset_minutes &&
      (*cfg.timezone.utc_offset_minutes < -14 * 60 || *cfg.timezone.utc_offset_minutes > 14 * 60)) {
    return Status::invalid_argument("timezone.utc_offset_minutes must be within +/-840");
  }
  if (cfg.storage.type != "sqlite" && cfg.storage.type != "memory") {
    return Status::invalid_argument("storage.type must be 'sqlite' or 'memory'");
  }
  if (cfg.storage.type == "sqlite" && cfg.storage.db_path.empty()) {
    return Status::invalid_argument("storage.db_path must not be empty for sqlite storage");
  }
  if (cfg.storage.presence_retention_days <= 0) {
    return Status::invalid_argument("storage.presence_retention_days must be > 0");
  }
  if (cfg.input.tick_hz <= 0.0) {
    return Status::invalid_argument("input.tick_hz must be > 0");
  }
  if (cfg.input.heartbeat_every_s < 0) {
    return Status::invalid_argument("input.heartbeat_every_s must be >= 0");
  }
  if (cfg.input.max_ticks < 0) {
    return Status::invalid_argument("input.max_ticks must be >= 0");
  }
  if (cfg.input.max_run_s < 0.0) {
    return Status::invalid_argument("input.max_run_s must be >= 0");
  }
  if (cfg.input.synth.active_s < 0.0 || cfg.input.synth.away_s < 0.0 ||
      cfg.input.synth.active_s + cfg.input.synth.away_s <= 0.0) {
    return Status::invalid_argument("input.synth.active_s/away_s must be >= 0 with a positive sum");
  }
  if (cfg.input.synth.time_scale <= 0.0) {
    return Status::invalid_argument("input.synth.time_scale must be > 0");
  }
  if (cfg.input.type != "synth" && cfg.input.type != "idle_file") {
    return Status::invalid_argument("input.type must be 'synth' or 'idle_file'");
  }
  if (cfg.input.type == "idle_file" && cfg.input.idle_file.path.empty()) {
    return Status::invalid_argument("input.idle_file.path must not be empty for idle_file input");
  }
  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  return Status::ok_status();
}

}  // namespace somni
