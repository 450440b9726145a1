// File: include/somni/presence/idle_source.hpp
#pragma once

#include <string>

#include "somni/core/status.hpp"
#include "somni/core/types.hpp"

namespace somni {

class IdleSource {
 public:
  virtual ~IdleSource() = default;

  // Seconds since the last keyboard/mouse input, as of `now`.
  // Returns:
  //  - OK with a value >= 0
  //  - unavailable(...) when the probe cannot be read right now (the monitor holds state)
  //  - other error codes for malformed probe output
  virtual Result<double> current_idle_seconds(TimestampNs now) = 0;

  virtual std::string name() const = 0;
};

}  // namespace somni
