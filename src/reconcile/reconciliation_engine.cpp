// File: src/reconcile/reconciliation_engine.cpp
#include "somni/reconcile/reconciliation_engine.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace somni {
namespace {

struct Span {
  std::size_t index = 0;  // position in the caller's vector
  std::int64_t id = 0;
  TimestampNs start;
  TimestampNs end;
  SegmentSource source = SegmentSource::kPresenceInferred;
};

// Tie order at equal timestamps.
enum class Boundary : int {
  kSleepStart = 0,
  kWakeEnd = 1,
  kWakeStart = 2,
  kSleepEnd = 3,
};

struct Edge {
  TimestampNs t;
  Boundary kind = Boundary::kSleepStart;
  std::int64_t id = 0;
  std::size_t span = 0;  // index into the sleep or wake span list
};

int source_priority(SegmentSource s) {
  switch (s) {
    case SegmentSource::kUserStated: return 3;
    case SegmentSource::kPresenceInferred: return 2;
    case SegmentSource::kAssumedColdStart: return 1;
  }
  return 0;
}

bool overlaps(const Span& a, const Span& b) { return a.start < b.end && b.start < a.end; }

std::optional<TimestampNs> close_at(const std::optional<TimestampNs>& end, const ReconcileOptions& options) {
  return end ? end : options.open_end;
}

std::vector<Span> normalize_sleep(const std::vector<SleepSegment>& in, const ReconcileOptions& options) {
  std::vector<Span> out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    const auto& s = in[i];
    const auto end = close_at(s.end, options);
    if (!end) {
      spdlog::debug("sleep segment {} is ongoing and no close instant was given; skipped", s.id);
      continue;
    }
    if (*end < s.start) {
      spdlog::warn("sleep segment {} ends before it starts; skipped", s.id);
      continue;
    }
    out.push_back(Span{i, s.id, s.start, *end, s.source});
  }
  return out;
}

std::vector<Span> normalize_wake(const std::vector<WakeSegment>& in, const ReconcileOptions& options) {
  std::vector<Span> out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    const auto& w = in[i];
    const auto end = close_at(w.effective_end(), options);
    if (!end) {
      spdlog::debug("wake segment {} is ongoing and no close instant was given; skipped", w.id);
      continue;
    }
    if (*end < w.start) {
      spdlog::warn("wake segment {} ends before it starts; skipped", w.id);
      continue;
    }
    out.push_back(Span{i, w.id, w.start, *end, w.source});
  }
  return out;
}

// Step 0: user data supersedes overlapping system data.
std::vector<Span> drop_superseded(const std::vector<Span>& sleep, int* discarded) {
  std::vector<Span> out;
  out.reserve(sleep.size());
  for (const auto& s : sleep) {
    if (is_system_source(s.source)) {
      const bool superseded = std::any_of(sleep.begin(), sleep.end(), [&s](const Span& u) {
        return !is_system_source(u.source) && overlaps(s, u);
      });
      if (superseded) {
        ++*discarded;
        continue;
      }
    }
    out.push_back(s);
  }
  return out;
}

// Minutes of [start, end) per source, each elementary slice credited to the best covering source.
std::map<SegmentSource, double> attribute_sources(TimestampNs start, TimestampNs end, const std::vector<Span>& sleep) {
  std::vector<TimestampNs> cuts{start, end};
  for (const auto& s : sleep) {
    if (s.start > start && s.start < end) cuts.push_back(s.start);
    if (s.end > start && s.end < end) cuts.push_back(s.end);
  }
  std::sort(cuts.begin(), cuts.end());
  cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());

  std::map<SegmentSource, double> minutes;
  for (std::size_t i = 0; i + 1 < cuts.size(); ++i) {
    const TimestampNs a = cuts[i];
    const TimestampNs b = cuts[i + 1];
    const Span* best = nullptr;
    for (const auto& s : sleep) {
      if (s.start <= a && s.end >= b &&
          (!best || source_priority(s.source) > source_priority(best->source))) {
        best = &s;
      }
    }
    if (best) minutes[best->source] += minutes_between(a, b);
  }
  return minutes;
}

SegmentSource dominant(const std::map<SegmentSource, double>& minutes) {
  SegmentSource best = SegmentSource::kPresenceInferred;
  double best_min = -1.0;
  for (const auto& [src, m] : minutes) {
    if (m > best_min || (m == best_min && source_priority(src) > source_priority(best))) {
      best = src;
      best_min = m;
    }
  }
  return best;
}

// Rejoins periods separated by at most gap_minutes; interruptions inside such a gap become sleep.
void absorb_short_gaps(ReconciledNight& night, double gap_minutes) {
  if (night.sleep_periods.size() < 2 || gap_minutes <= 0.0) return;

  std::vector<SleepPeriod> merged;
  merged.push_back(night.sleep_periods.front());
  for (std::size_t i = 1; i < night.sleep_periods.size(); ++i) {
    const SleepPeriod& next = night.sleep_periods[i];
    SleepPeriod& cur = merged.back();
    if (minutes_between(cur.end, next.start) > gap_minutes) {
      merged.push_back(next);
      continue;
    }
    const TimestampNs gap_start = cur.end;
    const TimestampNs gap_end = next.start;
    auto& wi = night.wake_interruptions;
    wi.erase(std::remove_if(wi.begin(), wi.end(),
                            [gap_start, gap_end](const WakeInterruption& w) {
                              return w.start >= gap_start && w.end <= gap_end;
                            }),
             wi.end());
    cur.end = next.end;
  }
  night.sleep_periods = std::move(merged);
}

}  // namespace

SleepQuality grade_sleep(double total_sleep_minutes, const ReconcileOptions& options) {
  if (total_sleep_minutes <= 0.0) return SleepQuality::kNone;
  if (total_sleep_minutes >= options.good_minutes) return SleepQuality::kGood;
  if (total_sleep_minutes >= options.fair_minutes) return SleepQuality::kFair;
  return SleepQuality::kPoor;
}

ReconciledNight reconcile(const std::vector<SleepSegment>& sleep_in, const std::vector<WakeSegment>& wake_in,
                          const ReconcileOptions& options) {
  ReconciledNight night;

  const std::vector<Span> sleep = drop_superseded(normalize_sleep(sleep_in, options), &night.discarded_system_segments);
  const std::vector<Span> wake = normalize_wake(wake_in, options);

  // --- Step 1: boundary stream
  std::vector<Edge> edges;
  edges.reserve(2 * (sleep.size() + wake.size()));
  for (std::size_t i = 0; i < sleep.size(); ++i) {
    edges.push_back(Edge{sleep[i].start, Boundary::kSleepStart, sleep[i].id, i});
    edges.push_back(Edge{sleep[i].end, Boundary::kSleepEnd, sleep[i].id, i});
  }
  for (std::size_t i = 0; i < wake.size(); ++i) {
    edges.push_back(Edge{wake[i].start, Boundary::kWakeStart, wake[i].id, i});
    edges.push_back(Edge{wake[i].end, Boundary::kWakeEnd, wake[i].id, i});
  }
  std::sort(edges.begin(), edges.end(), [](const Edge& a, const Edge& b) {
    if (a.t != b.t) return a.t < b.t;
    if (a.kind != b.kind) return static_cast<int>(a.kind) < static_cast<int>(b.kind);
    if (a.id != b.id) return a.id < b.id;
    return a.span < b.span;
  });

  // --- Step 2: walk
  // A wake that began inside sleep stays active until its own end, even across a sleep gap.
  int depth = 0;
  TimestampNs period_start;
  TimestampNs interruption_start;
  std::size_t interruption_wake = 0;  // wake whose notes label the current interruption
  std::set<std::size_t> active_wakes;
  std::set<std::size_t> ignored_wakes;

  const auto close_period = [&night](TimestampNs a, TimestampNs b) {
    if (b <= a) return;
    SleepPeriod p;
    p.start = a;
    p.end = b;
    night.sleep_periods.push_back(p);
  };
  const auto close_interruption = [&night, &wake, &wake_in](TimestampNs a, TimestampNs b, std::size_t w) {
    if (b <= a) return;
    const WakeSegment& src = wake_in[wake[w].index];
    WakeInterruption wi;
    wi.start = a;
    wi.end = b;
    wi.source = src.source;
    wi.notes = src.notes;
    wi.estimated = src.is_estimated();
    night.wake_interruptions.push_back(wi);
  };

  for (const auto& e : edges) {
    switch (e.kind) {
      case Boundary::kSleepStart:
        if (depth++ > 0) break;
        if (active_wakes.empty()) {
          period_start = e.t;
        } else {
          interruption_start = e.t;
          if (active_wakes.count(interruption_wake) == 0) interruption_wake = *active_wakes.begin();
        }
        break;

      case Boundary::kWakeStart:
        if (depth == 0) {
          spdlog::warn("wake segment {} starts outside any sleep; ignored", e.id);
          ignored_wakes.insert(e.span);
          break;
        }
        if (active_wakes.empty()) {
          close_period(period_start, e.t);
          interruption_start = e.t;
          interruption_wake = e.span;
        }
        active_wakes.insert(e.span);
        break;

      case Boundary::kWakeEnd:
        if (ignored_wakes.count(e.span) != 0 || active_wakes.erase(e.span) == 0) break;
        if (active_wakes.empty() && depth > 0) {
          close_interruption(interruption_start, e.t, interruption_wake);
          period_start = e.t;
        }
        break;

      case Boundary::kSleepEnd:
        if (--depth > 0) break;
        if (active_wakes.empty()) {
          close_period(period_start, e.t);
        } else {
          // Clip: the interruption cannot outlast its sleep.
          close_interruption(interruption_start, e.t, interruption_wake);
        }
        break;
    }
  }

  // --- Step 3: rejoin short splits
  absorb_short_gaps(night, options.merge_gap_minutes);

  // --- Step 4: summary
  if (night.sleep_periods.empty()) {
    night.quality = SleepQuality::kNone;
    for (const auto& w : night.wake_interruptions) night.total_wake_minutes += w.duration_minutes();
    return night;
  }

  std::size_t primary = 0;
  for (std::size_t i = 0; i < night.sleep_periods.size(); ++i) {
    SleepPeriod& p = night.sleep_periods[i];
    const auto by_source = attribute_sources(p.start, p.end, sleep);
    p.source = dominant(by_source);
    for (const auto& [src, m] : by_source) night.source_breakdown[src] += m;

    const double m = p.duration_minutes();
    night.total_sleep_minutes += m;
    if (m > night.sleep_periods[primary].duration_minutes()) primary = i;
  }
  night.sleep_periods[primary].primary = true;
  night.primary_sleep_minutes = night.sleep_periods[primary].duration_minutes();
  night.fragmented = night.sleep_periods.size() > 1;

  for (const auto& w : night.wake_interruptions) night.total_wake_minutes += w.duration_minutes();

  TimestampNs bed_start = sleep.front().start;
  TimestampNs bed_end = sleep.front().end;
  for (const auto& s : sleep) {
    bed_start = std::min(bed_start, s.start);
    bed_end = std::max(bed_end, s.end);
  }
  night.time_in_bed_minutes = minutes_between(bed_start, bed_end);
  night.quality = grade_sleep(night.total_sleep_minutes, options);
  return night;
}

}  // namespace somni
