// File: src/core/util/config_loader.cpp
#include "somni/core/util/config_loader.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace somni {
namespace fs = std::filesystem;

namespace {

constexpr int kMaxIncludeDepth = 8;

bool is_section(const YAML::Node& n) { return n && n.IsMap(); }

// Layers `top` over `base`. Mappings combine key by key; any other node in `top` replaces.
YAML::Node overlay(const YAML::Node& base, const YAML::Node& top) {
  if (!top) return base;
  if (!base || !base.IsMap() || !top.IsMap()) return top;

  YAML::Node out = YAML::Clone(base);
  for (const auto& kv : top) {
    const std::string key = kv.first.as<std::string>();
    out[key] = out[key] ? overlay(out[key], kv.second) : kv.second;
  }
  return out;
}

template <typename T>
void read_into(const YAML::Node& section, const char* key, T& out) {
  if (section && section[key]) out = section[key].as<T>();
}

Status read_clock_time(const YAML::Node& section, const char* key, ClockTime& out) {
  if (!section || !section[key]) return Status::ok_status();
  auto t = parse_hhmm(section[key].as<std::string>());
  if (!t.ok()) return Status(t.status().code(), std::string(key) + ": " + t.status().message());
  out = t.take_value();
  return Status::ok_status();
}

Result<YAML::Node> parse_yaml_file(const fs::path& path) {
  using R = Result<YAML::Node>;
  std::error_code ec;
  if (!fs::exists(path, ec)) return R::err(Status::not_found("config not found: " + path.string()));
  try {
    return R::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return R::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return R::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

// Reads `path`, then every file named under its `includes:` key (relative to `path`).
// Later layers win; the including file itself is applied last.
Result<YAML::Node> resolve_includes(const fs::path& path, int depth) {
  using R = Result<YAML::Node>;
  if (depth > kMaxIncludeDepth) {
    return R::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto doc_r = parse_yaml_file(path);
  if (!doc_r.ok()) return doc_r;
  YAML::Node doc = doc_r.take_value();

  const YAML::Node includes = doc["includes"];
  if (!includes) return R::ok(doc);
  if (!includes.IsSequence()) return R::err(Status::invalid_argument("includes must be a YAML sequence"));

  YAML::Node layered;
  for (const auto& entry : includes) {
    fs::path child(entry.as<std::string>());
    if (child.is_relative()) child = path.parent_path() / child;
    auto child_r = resolve_includes(child, depth + 1);
    if (!child_r.ok()) return child_r;
    layered = overlay(layered, child_r.value());
  }

  doc.remove("includes");
  return R::ok(overlay(layered, doc));
}

void warn_default_sleep_window_once(const SleepWindowConfig& d) {
  static std::atomic<bool> warned{false};
  if (warned.exchange(true)) return;
  spdlog::warn("config: no sleep_window section, using defaults {}-{} (min sleep {} min, typical wake {})",
               format_hhmm(d.start), format_hhmm(d.end), d.min_sleep_minutes, format_hhmm(d.typical_wake));
}

Result<Config> config_from_yaml(const YAML::Node& y) {
  Config cfg;  // unset keys keep the struct defaults

  try {
    // --- presence
    if (is_section(y["presence"])) {
      const auto p = y["presence"];
      read_into(p, "grace_threshold_s", cfg.presence.grace_threshold_s);
      read_into(p, "confirm_threshold_s", cfg.presence.confirm_threshold_s);
      read_into(p, "return_threshold_s", cfg.presence.return_threshold_s);
    }

    // --- sleep window
    if (is_section(y["sleep_window"])) {
      const auto s = y["sleep_window"];
      for (const Status& st : {read_clock_time(s, "start", cfg.sleep_window.start),
                               read_clock_time(s, "end", cfg.sleep_window.end),
                               read_clock_time(s, "typical_wake", cfg.sleep_window.typical_wake)}) {
        if (!st.ok()) return Result<Config>::err(Status(st.code(), "sleep_window." + st.message()));
      }
      read_into(s, "min_sleep_minutes", cfg.sleep_window.min_sleep_minutes);
      read_into(s, "real_wake_grace_minutes", cfg.sleep_window.real_wake_grace_minutes);
    } else {
      warn_default_sleep_window_once(cfg.sleep_window);
    }

    // --- reconcile
    if (is_section(y["reconcile"])) {
      const auto r = y["reconcile"];
      read_into(r, "lookback_hours", cfg.reconcile.lookback_hours);
      read_into(r, "good_minutes", cfg.reconcile.good_minutes);
      read_into(r, "fair_minutes", cfg.reconcile.fair_minutes);
      read_into(r, "merge_gap_minutes", cfg.reconcile.merge_gap_minutes);
    }

    // --- timezone
    if (is_section(y["timezone"])) {
      const auto t = y["timezone"];
      if (t["utc_offset_minutes"]) cfg.timezone.utc_offset_minutes = t["utc_offset_minutes"].as<int>();
    }

    // --- storage
    if (is_section(y["storage"])) {
      const auto s = y["storage"];
      read_into(s, "type", cfg.storage.type);
      read_into(s, "db_path", cfg.storage.db_path);
      read_into(s, "presence_retention_days", cfg.storage.presence_retention_days);
    }

    // --- input
    if (is_section(y["input"])) {
      const auto i = y["input"];
      read_into(i, "type", cfg.input.type);
      read_into(i, "tick_hz", cfg.input.tick_hz);
      read_into(i, "heartbeat_every_s", cfg.input.heartbeat_every_s);
      read_into(i, "max_ticks", cfg.input.max_ticks);
      read_into(i, "max_run_s", cfg.input.max_run_s);

      if (is_section(i["synth"])) {
        const auto s = i["synth"];
        read_into(s, "active_s", cfg.input.synth.active_s);
        read_into(s, "away_s", cfg.input.synth.away_s);
        read_into(s, "time_scale", cfg.input.synth.time_scale);
      }
      if (is_section(i["idle_file"])) {
        const auto f = i["idle_file"];
        read_into(f, "path", cfg.input.idle_file.path);
        read_into(f, "max_age_s", cfg.input.idle_file.max_age_s);
      }
    }

    // --- output
    if (is_section(y["output"])) {
      read_into(y["output"], "out_dir", cfg.output.out_dir);
    }

    // --- logging
    if (is_section(y["logging"])) {
      const auto l = y["logging"];
      read_into(l, "level", cfg.logging.level);
      read_into(l, "file", cfg.logging.file);
    }
  } catch (const YAML::Exception& e) {
    // Wrong scalar types (e.g. "abc" for a number) surface here.
    return Result<Config>::err(Status::parse_error(std::string("config value error: ") + e.what()));
  }

  // Cross-field checks run on the fully layered result.
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace

Result<Config> load_config(const std::string& path_str) {
  auto yaml_r = resolve_includes(fs::path(path_str), 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return config_from_yaml(yaml_r.take_value());
}

Result<Config> load_config_from_string(const std::string& yaml_text) {
  YAML::Node y;
  try {
    y = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
  return config_from_yaml(y);
}

}  // namespace somni
