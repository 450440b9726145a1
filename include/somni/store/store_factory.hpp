// File: include/somni/store/store_factory.hpp
#pragma once

#include <memory>
#include <string>

#include "somni/core/config.hpp"
#include "somni/core/status.hpp"
#include "somni/store/telemetry_store.hpp"

namespace somni {

// Builds and opens the store named by storage.type.
Result<std::unique_ptr<TelemetryStore>> open_telemetry_store(const StorageConfig& cfg);

// "sqlite:<path>" or "memory", for logs and the journal header.
std::string describe_store(const StorageConfig& cfg);

}  // namespace somni
