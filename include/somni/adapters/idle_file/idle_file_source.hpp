// File: include/somni/adapters/idle_file/idle_file_source.hpp
#pragma once

#include <string>

#include "somni/core/config.hpp"
#include "somni/presence/idle_source.hpp"

namespace somni {

// Reads the idle time written by an OS-level probe (xprintidle, ioreg, a
// GetLastInputInfo helper...). The file holds one number: idle seconds.
// A file not rewritten within max_age_s means the probe stalled -> unavailable.
class IdleFileSource final : public IdleSource {
 public:
  explicit IdleFileSource(InputIdleFileConfig cfg);

  // Call once after construction. Keeps ctor simple (no throwing / no implicit IO).
  // A missing file is fine here (the probe may start later); an empty path is not.
  Status open();

  Result<double> current_idle_seconds(TimestampNs now) override;

  std::string name() const override { return "idle_file"; }

 private:
  Status check_fresh_() const;

  InputIdleFileConfig cfg_;
  bool opened_{false};
};

}  // namespace somni
