// File: include/somni/adapters/synth/synth_idle_source.hpp
#pragma once

#include <optional>
#include <string>

#include "somni/core/config.hpp"
#include "somni/presence/idle_source.hpp"

namespace somni {

// Deterministic idle pattern for demos and replays:
// active for active_s (idle stays near zero), then idle for away_s, repeat.
// The pattern is anchored at the first sampled instant.
class SynthIdleSource final : public IdleSource {
 public:
  explicit SynthIdleSource(InputSynthConfig cfg);

  Result<double> current_idle_seconds(TimestampNs now) override;

  std::string name() const override { return "synth"; }

 private:
  InputSynthConfig cfg_;
  std::optional<TimestampNs> origin_;
};

}  // namespace somni
