// File: src/adapters/idle_file/idle_file_source.cpp
#include "somni/adapters/idle_file/idle_file_source.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace somni {

IdleFileSource::IdleFileSource(InputIdleFileConfig cfg) : cfg_(std::move(cfg)) {}

Status IdleFileSource::open() {
  if (cfg_.path.empty()) return Status::invalid_argument("IdleFileSource: path is empty");

  std::error_code ec;
  if (!std::filesystem::exists(cfg_.path, ec)) {
    spdlog::warn("idle probe file {} does not exist yet", cfg_.path);
  }
  opened_ = true;
  return Status::ok_status();
}

Status IdleFileSource::check_fresh_() const {
  if (cfg_.max_age_s <= 0.0) return Status::ok_status();

  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(cfg_.path, ec);
  if (ec) return Status::unavailable("IdleFileSource: cannot stat " + cfg_.path + ": " + ec.message());

  const auto age = std::filesystem::file_time_type::clock::now() - mtime;
  const double age_s = std::chrono::duration<double>(age).count();
  if (age_s > cfg_.max_age_s) {
    return Status::unavailable("IdleFileSource: probe file is stale (" + std::to_string(age_s) + " s old)");
  }
  return Status::ok_status();
}

Result<double> IdleFileSource::current_idle_seconds(TimestampNs /*now*/) {
  if (!opened_) {
    return Result<double>::err(Status::invalid_argument("IdleFileSource: not opened"));
  }

  std::ifstream f(cfg_.path);
  if (!f.is_open()) {
    return Result<double>::err(Status::unavailable("IdleFileSource: failed to open " + cfg_.path));
  }

  const Status fresh = check_fresh_();
  if (!fresh.ok()) return Result<double>::err(fresh);

  std::stringstream buf;
  buf << f.rdbuf();
  std::istringstream in(buf.str());

  double idle_s = 0.0;
  if (!(in >> idle_s)) {
    // Probe may be mid-write; treat as a transient gap, not corruption.
    return Result<double>::err(Status::unavailable("IdleFileSource: no number in " + cfg_.path));
  }
  std::string trailing;
  if (in >> trailing) {
    return Result<double>::err(Status::corrupt_data("IdleFileSource: unexpected text after idle value: " + trailing));
  }
  if (!std::isfinite(idle_s) || idle_s < 0.0) {
    return Result<double>::err(Status::corrupt_data("IdleFileSource: idle value out of range"));
  }
  return Result<double>::ok(idle_s);
}

}  // namespace somni
