// File: include/somni/core/util/config_loader.hpp
#pragma once

#include <string>

#include "somni/core/config.hpp"
#include "somni/core/status.hpp"

namespace somni {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - A missing sleep_window section keeps the documented defaults (warned once).
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Same, from an in-memory YAML document (no includes).
Result<Config> load_config_from_string(const std::string& yaml_text);

}  // namespace somni
