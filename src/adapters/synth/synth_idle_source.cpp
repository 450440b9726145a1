// File: src/adapters/synth/synth_idle_source.cpp
#include "somni/adapters/synth/synth_idle_source.hpp"

#include <cmath>
#include <utility>

namespace somni {
namespace {

// While "active" the simulated user touches the keyboard every couple of seconds.
constexpr double kActiveInputPeriodS = 2.0;

}  // namespace

SynthIdleSource::SynthIdleSource(InputSynthConfig cfg) : cfg_(std::move(cfg)) {}

Result<double> SynthIdleSource::current_idle_seconds(TimestampNs now) {
  if (!origin_) origin_ = now;
  if (now < *origin_) {
    return Result<double>::err(Status::invalid_argument("SynthIdleSource: time went backwards"));
  }

  const double cycle_s = cfg_.active_s + cfg_.away_s;
  if (cycle_s <= 0.0) {
    return Result<double>::err(Status::invalid_argument("SynthIdleSource: empty cycle"));
  }

  const double t_s = static_cast<double>(now.ns - origin_->ns) * 1e-9;
  const double phase_s = std::fmod(t_s, cycle_s);

  if (phase_s < cfg_.active_s) {
    return Result<double>::ok(std::fmod(phase_s, kActiveInputPeriodS));
  }
  return Result<double>::ok(phase_s - cfg_.active_s);
}

}  // namespace somni
