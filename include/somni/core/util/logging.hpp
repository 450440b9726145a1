// File: include/somni/core/util/logging.hpp
#pragma once

#include "somni/core/config.hpp"
#include "somni/core/status.hpp"

namespace somni {

// Installs the default spdlog logger: stderr, plus logging.file when set.
// Unknown levels are rejected rather than silently mapped to info.
Status init_logging(const LoggingConfig& cfg);

}  // namespace somni
