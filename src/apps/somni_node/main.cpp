// File: src/apps/somni_node/main.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "somni/adapters/idle_file/idle_file_source.hpp"
#include "somni/adapters/synth/synth_idle_source.hpp"
#include "somni/core/util/config_loader.hpp"
#include "somni/core/util/local_clock.hpp"
#include "somni/core/util/logging.hpp"
#include "somni/events/jsonl_event_sink.hpp"
#include "somni/presence/idle_source.hpp"
#include "somni/service/presence_service.hpp"
#include "somni/store/store_factory.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int /*sig*/) { g_stop.store(true); }

struct Args {
  std::string config_path;
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
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "somni_node\n"
            << "  --config <path>\n";
}

// Synth input runs on a scaled clock so a night can be replayed in minutes.
class RunClock {
 public:
  explicit RunClock(double time_scale) : scale_(time_scale) {}

  somni::TimestampNs now() const {
    const auto elapsed = std::chrono::steady_clock::now() - t0_steady_;
    const double ns = static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
    return t0_wall_.plus(static_cast<somni::DurationNs>(ns * scale_));
  }

 private:
  double scale_;
  std::chrono::steady_clock::time_point t0_steady_{std::chrono::steady_clock::now()};
  somni::TimestampNs t0_wall_{somni::wall_now()};
};

somni::Result<std::unique_ptr<somni::IdleSource>> make_source_from_config(const somni::Config& cfg) {
  using R = somni::Result<std::unique_ptr<somni::IdleSource>>;

  if (cfg.input.type == "synth") {
    return R::ok(std::make_unique<somni::SynthIdleSource>(cfg.input.synth));
  }

  if (cfg.input.type == "idle_file") {
    auto src = std::make_unique<somni::IdleFileSource>(cfg.input.idle_file);
    const somni::Status st = src->open();
    if (!st.ok()) return R::err(st);
    return R::ok(std::move(src));
  }

  return R::err(somni::Status::invalid_argument("Unknown input.type: " + cfg.input.type));
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = somni::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  const somni::Config cfg = cfg_r.take_value();

  const somni::Status st_log = somni::init_logging(cfg.logging);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 1;
  }

  auto store_r = somni::open_telemetry_store(cfg.storage);
  if (!store_r.ok()) {
    spdlog::critical("cannot open telemetry store: {}", store_r.status().message());
    return 2;
  }
  std::unique_ptr<somni::TelemetryStore> store = store_r.take_value();

  auto source_r = make_source_from_config(cfg);
  if (!source_r.ok()) {
    spdlog::critical("{}", source_r.status().message());
    return 2;
  }
  std::unique_ptr<somni::IdleSource> source = source_r.take_value();

  const RunClock run_clock(cfg.input.type == "synth" ? cfg.input.synth.time_scale : 1.0);

  somni::prune_event_journals(cfg.output.out_dir, /*keep_last=*/50);

  somni::JsonlEventSink sink;
  somni::RunInfo run;
  run.config_path = args.config_path;
  run.out_dir = cfg.output.out_dir;
  run.store = somni::describe_store(cfg.storage);
  run.start_time = somni::wall_now();

  const somni::Status st_sink = sink.open(run);
  if (!st_sink.ok()) {
    spdlog::critical("{}", st_sink.message());
    return 2;
  }

  somni::PresenceService service(cfg, *store, somni::LocalClock::from_config(cfg.timezone), &sink);
  service.set_day_start_callback([&service](somni::TimestampNs wake) {
    spdlog::info("day start at {}", service.clock().format_local(wake));
  });

  const somni::Status st_start = service.start(run_clock.now());
  if (!st_start.ok()) {
    spdlog::critical("startup failed: {}", st_start.message());
    return 2;
  }

  // Ensure we always close/flush cleanly.
  struct Guard {
    somni::JsonlEventSink& s;
    ~Guard() {
      (void)s.flush();
      s.close();
    }
  } guard{sink};

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::cout << "Events: " << sink.path() << " (latest: " << sink.latest_path() << ")\n";
  std::cout << "Input: " << source->name() << "  tick_hz=" << cfg.input.tick_hz
            << "  heartbeat_every_s=" << cfg.input.heartbeat_every_s
            << "  store=" << run.store << "\n\n";

  using clock = std::chrono::steady_clock;

  const auto tick_period = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(1.0 / cfg.input.tick_hz));

  const auto t_start = clock::now();
  auto next_tick = t_start + tick_period;
  auto last_hb = t_start;
  somni::TimestampNs last_prune{0};

  const auto emit = [&sink](const std::string& type, somni::TimestampNs t, const std::string& message) {
    somni::Event e;
    e.type = type;
    e.timestamp = t;
    e.message = message;
    const somni::Status st = sink.emit(e);
    if (!st.ok()) spdlog::warn("journal write failed: {}", st.message());
  };

  std::int64_t tick_count = 0;

  while (true) {
    const auto wall = clock::now();
    const somni::TimestampNs now = run_clock.now();

    if (g_stop.load()) {
      emit("shutdown", now, "signal received");
      break;
    }

    if (cfg.input.max_ticks > 0 && tick_count >= cfg.input.max_ticks) {
      emit("shutdown", now, "max_ticks reached");
      break;
    }

    if (cfg.input.max_run_s > 0.0) {
      const auto max_d = std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::duration<double>(cfg.input.max_run_s));
      if (wall - t_start >= max_d) {
        emit("shutdown", now, "max_runtime reached");
        break;
      }
    }

    if (now.ns - last_prune.ns >= somni::kNsPerDay) {
      last_prune = now;
      auto pruned = service.prune(now);
      if (!pruned.ok()) spdlog::warn("presence retention prune failed: {}", pruned.status().message());
    }

    const somni::Result<double> idle = source->current_idle_seconds(now);
    auto state_r = service.tick(idle, now);
    if (!state_r.ok()) {
      // Storage trouble: keep polling, the transition is retried next tick.
      spdlog::error("tick failed: {}", state_r.status().message());
    }

    if (cfg.input.heartbeat_every_s > 0 &&
        wall - last_hb >= std::chrono::seconds(cfg.input.heartbeat_every_s)) {
      last_hb = wall;
      const somni::PresenceState s = service.get_presence_state();
      emit("heartbeat", now,
           "alive tick=" + std::to_string(tick_count) + " state=" + somni::to_string(s.kind) +
               (s.signal_degraded ? " degraded" : ""));
    }

    const somni::Status st_flush = sink.flush();
    if (!st_flush.ok()) spdlog::warn("{}", st_flush.message());

    ++tick_count;

    const auto after = clock::now();
    if (after < next_tick) {
      std::this_thread::sleep_until(next_tick);
      next_tick += tick_period;
    } else {
      next_tick = after + tick_period;
    }
  }

  spdlog::info("stopped after {} tick(s)", tick_count);
  std::cout << "OK\n";
  return 0;
}
