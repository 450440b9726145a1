// File: src/store/store_factory.cpp
#include "somni/store/store_factory.hpp"

#include "somni/store/memory_telemetry_store.hpp"
#include "somni/store/sqlite_telemetry_store.hpp"

namespace somni {

Result<std::unique_ptr<TelemetryStore>> open_telemetry_store(const StorageConfig& cfg) {
  using R = Result<std::unique_ptr<TelemetryStore>>;

  if (cfg.type == "memory") {
    return R::ok(std::make_unique<MemoryTelemetryStore>());
  }
  if (cfg.type == "sqlite") {
    auto store = std::make_unique<SqliteTelemetryStore>(cfg.db_path);
    const Status st = store->open();
    if (!st.ok()) return R::err(st);
    return R::ok(std::move(store));
  }
  return R::err(Status::invalid_argument("unknown storage.type: " + cfg.type));
}

std::string describe_store(const StorageConfig& cfg) {
  if (cfg.type == "sqlite") return "sqlite:" + cfg.db_path;
  return cfg.type;
}

}  // namespace somni
