// File: include/somni/reconcile/reconciliation_engine.hpp
#pragma once

#include <optional>
#include <vector>

#include "somni/core/config.hpp"
#include "somni/core/types.hpp"

namespace somni {

struct ReconcileOptions {
  // Ongoing segments (no end) close here; without it they are skipped.
  std::optional<TimestampNs> open_end;

  double good_minutes = 420.0;
  double fair_minutes = 360.0;

  // Periods separated by at most this many minutes are rejoined (0 keeps every split).
  double merge_gap_minutes = 2.0;

  static ReconcileOptions from_config(const ReconcileConfig& cfg, std::optional<TimestampNs> open_end) {
    ReconcileOptions o;
    o.open_end = open_end;
    o.good_minutes = cfg.good_minutes;
    o.fair_minutes = cfg.fair_minutes;
    o.merge_gap_minutes = cfg.merge_gap_minutes;
    return o;
  }
};

// Folds sleep and wake segments into one night.
//
// Steps:
//  0) system segments overlapping any user-stated segment are discarded
//  1) surviving sleep + all wake segments become a chronological boundary stream
//     (ties: sleep_start, wake_end, wake_start, sleep_end, then segment id)
//  2) walk: nested sleep tracked by depth; wake splits the open period; a period that ends
//     while a wake is open clips that wake, and the wake still covers any sleep that
//     starts before the wake ends
//  3) periods separated by a short gap (merge_gap_minutes) are rejoined
//  4) totals, primary period, per-source minutes, quality grade
//
// Pure and deterministic: same input, same output. Malformed segments are skipped with a warning.
ReconciledNight reconcile(const std::vector<SleepSegment>& sleep, const std::vector<WakeSegment>& wake,
                          const ReconcileOptions& options = {});

SleepQuality grade_sleep(double total_sleep_minutes, const ReconcileOptions& options);

}  // namespace somni
