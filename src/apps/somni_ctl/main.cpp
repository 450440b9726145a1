// File: src/apps/somni_ctl/main.cpp
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "somni/core/util/config_loader.hpp"
#include "somni/core/util/local_clock.hpp"
#include "somni/core/util/logging.hpp"
#include "somni/presence/presence_monitor.hpp"
#include "somni/service/presence_service.hpp"
#include "somni/store/store_factory.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string command;
  std::map<std::string, std::string> opts;  // "--start" -> value
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s.rfind("--", 0) == 0 && i + 1 < argc) {
      a.opts[s] = argv[++i];
      continue;
    }
    if (a.command.empty() && s.rfind("--", 0) != 0) {
      a.command = s;
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "somni_ctl --config <path> <command>\n"
            << "  state                                   presence state from the stored events\n"
            << "  stats [--since ISO]                     presence statistics (default: last 24 h)\n"
            << "  night [--at ISO]                        reconciled night ending at --at (default: now)\n"
            << "  sleep --start ISO --end ISO [--note T]  record a user-stated sleep\n"
            << "  wake --start ISO (--end ISO | --minutes N) [--notes T]\n"
            << "                                          record a wake inside a sleep\n";
}

std::optional<std::string> opt(const Args& a, const std::string& key) {
  const auto it = a.opts.find(key);
  if (it == a.opts.end()) return std::nullopt;
  return it->second;
}

// Parses an optional ISO timestamp option; missing means `fallback`.
somni::Result<somni::TimestampNs> time_opt(const Args& a, const std::string& key, somni::TimestampNs fallback) {
  const auto v = opt(a, key);
  if (!v) return somni::Result<somni::TimestampNs>::ok(fallback);
  return somni::parse_iso8601(*v);
}

somni::Result<somni::TimestampNs> required_time(const Args& a, const std::string& key) {
  const auto v = opt(a, key);
  if (!v) return somni::Result<somni::TimestampNs>::err(somni::Status::invalid_argument(key + " is required"));
  return somni::parse_iso8601(*v);
}

std::string fmt_min(double m) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << m;
  return ss.str();
}

int fail(const somni::Status& st) {
  std::cerr << "error: " << st.message() << "\n";
  return st.code() == somni::Status::Code::kInvalidArgument || st.code() == somni::Status::Code::kParseError ? 2 : 1;
}

int cmd_state(const somni::Config& cfg, somni::TelemetryStore& store, const somni::LocalClock& lc,
              somni::TimestampNs now) {
  const somni::TimestampNs since =
      now.minus(static_cast<somni::DurationNs>(cfg.storage.presence_retention_days) * somni::kNsPerDay);
  auto events_r = store.presence_events_since(since);
  if (!events_r.ok()) return fail(events_r.status());

  const somni::PresenceState s = somni::derive_presence_state(events_r.value());
  std::cout << "state: " << somni::to_string(s.kind) << "\n";
  if (s.away_since) {
    std::cout << "away_since: " << lc.format_local(*s.away_since) << " ("
              << fmt_min(somni::minutes_between(*s.away_since, now)) << " min)\n";
  }
  if (s.grace_start && !s.away_since) std::cout << "grace_start: " << lc.format_local(*s.grace_start) << "\n";
  if (s.active_since) std::cout << "active_since: " << lc.format_local(*s.active_since) << "\n";
  std::cout << "idle_seconds_at_last_event: " << fmt_min(s.idle_seconds) << "\n";
  return 0;
}

int cmd_stats(const Args& a, const somni::Config& cfg, somni::PresenceService& svc, somni::TimestampNs now) {
  auto since_r = time_opt(a, "--since", now.minus(static_cast<somni::DurationNs>(cfg.reconcile.lookback_hours * 3600.0) *
                                                   somni::kNsPerSecond));
  if (!since_r.ok()) return fail(since_r.status());

  const somni::PresenceStatistics st = svc.get_presence_statistics(since_r.value(), now);
  std::cout << "since: " << svc.clock().format_local(since_r.value()) << "\n"
            << "total_active_minutes: " << fmt_min(st.total_active_minutes) << "\n"
            << "total_away_minutes: " << fmt_min(st.total_away_minutes) << "\n"
            << "away_count: " << st.away_count << "\n"
            << "longest_away_minutes: " << fmt_min(st.longest_away_minutes) << "\n"
            << "current_session_minutes: " << fmt_min(st.current_session_minutes) << "\n"
            << "current_away_minutes: " << fmt_min(st.current_away_minutes) << "\n";
  return 0;
}

int cmd_night(const Args& a, somni::PresenceService& svc, somni::TimestampNs now) {
  auto at_r = time_opt(a, "--at", now);
  if (!at_r.ok()) return fail(at_r.status());

  const somni::ReconciledNight n = svc.get_reconciled_night(at_r.value());
  const somni::LocalClock& lc = svc.clock();

  std::cout << "total_sleep_minutes: " << fmt_min(n.total_sleep_minutes) << "\n"
            << "total_wake_minutes: " << fmt_min(n.total_wake_minutes) << "\n"
            << "primary_sleep_minutes: " << fmt_min(n.primary_sleep_minutes) << "\n"
            << "time_in_bed_minutes: " << fmt_min(n.time_in_bed_minutes) << "\n"
            << "fragmented: " << (n.fragmented ? "yes" : "no") << "\n"
            << "quality: " << somni::to_string(n.quality) << "\n";
  if (n.discarded_system_segments > 0) {
    std::cout << "discarded_system_segments: " << n.discarded_system_segments << "\n";
  }
  for (const auto& p : n.sleep_periods) {
    std::cout << "  sleep " << lc.format_local(p.start) << " -> " << lc.format_local(p.end) << "  "
              << fmt_min(p.duration_minutes()) << " min  " << somni::to_string(p.source)
              << (p.primary ? "  primary" : "") << "\n";
  }
  for (const auto& w : n.wake_interruptions) {
    std::cout << "  wake  " << lc.format_local(w.start) << " -> " << lc.format_local(w.end) << "  "
              << fmt_min(w.duration_minutes()) << " min" << (w.estimated ? " (estimated)" : "")
              << (w.notes.empty() ? "" : "  " + w.notes) << "\n";
  }
  for (const auto& [src, m] : n.source_breakdown) {
    std::cout << "  source " << somni::to_string(src) << ": " << fmt_min(m) << " min\n";
  }
  return 0;
}

int cmd_sleep(const Args& a, somni::PresenceService& svc) {
  auto start_r = required_time(a, "--start");
  if (!start_r.ok()) return fail(start_r.status());
  auto end_r = required_time(a, "--end");
  if (!end_r.ok()) return fail(end_r.status());

  auto r = svc.record_statement(start_r.value(), end_r.value(), opt(a, "--note").value_or(""));
  if (!r.ok()) return fail(r.status());
  std::cout << "recorded " << r.value() << " interval(s)\n";
  return 0;
}

int cmd_wake(const Args& a, somni::PresenceService& svc) {
  auto start_r = required_time(a, "--start");
  if (!start_r.ok()) return fail(start_r.status());

  somni::StatedInterval iv;
  iv.kind = somni::StatedInterval::Kind::kWake;
  iv.start = start_r.value();
  iv.notes = opt(a, "--notes").value_or("");

  if (opt(a, "--end")) {
    auto end_r = required_time(a, "--end");
    if (!end_r.ok()) return fail(end_r.status());
    iv.end = end_r.value();
  } else if (const auto minutes = opt(a, "--minutes")) {
    std::istringstream in(*minutes);
    if (!(in >> iv.estimated_minutes) || iv.estimated_minutes <= 0.0) {
      return fail(somni::Status::invalid_argument("--minutes must be a positive number"));
    }
  } else {
    return fail(somni::Status::invalid_argument("wake needs --end or --minutes"));
  }

  auto r = svc.record_intervals({iv});
  if (!r.ok()) return fail(r.status());
  std::cout << "recorded " << r.value() << " interval(s)\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty() || args.command.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = somni::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  somni::Config cfg = cfg_r.take_value();

  // Keep stdout for the command's output; only problems are logged.
  if (cfg.logging.level == "info" || cfg.logging.level == "debug" || cfg.logging.level == "trace") {
    cfg.logging.level = "warn";
  }
  const somni::Status st_log = somni::init_logging(cfg.logging);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 1;
  }

  if (cfg.storage.type == "memory") {
    std::cerr << "somni_ctl needs a persistent store (storage.type: sqlite)\n";
    return 2;
  }

  auto store_r = somni::open_telemetry_store(cfg.storage);
  if (!store_r.ok()) return fail(store_r.status());
  std::unique_ptr<somni::TelemetryStore> store = store_r.take_value();

  const somni::LocalClock lc = somni::LocalClock::from_config(cfg.timezone);
  somni::PresenceService svc(cfg, *store, lc);
  const somni::TimestampNs now = somni::wall_now();

  if (args.command == "state") return cmd_state(cfg, *store, lc, now);
  if (args.command == "stats") return cmd_stats(args, cfg, svc, now);
  if (args.command == "night") return cmd_night(args, svc, now);
  if (args.command == "sleep") return cmd_sleep(args, svc);
  if (args.command == "wake") return cmd_wake(args, svc);

  std::cerr << "unknown command: " << args.command << "\n";
  print_usage();
  return 2;
}
