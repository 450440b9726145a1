// File: src/core/util/logging.cpp
#include "somni/core/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace somni {

Status init_logging(const LoggingConfig& cfg) {
  const auto level = spdlog::level::from_str(cfg.level);
  // from_str maps anything unknown to off; only accept that when it was asked for.
  if (level == spdlog::level::off && cfg.level != "off") {
    return Status::invalid_argument("logging.level: unknown level '" + cfg.level + "'");
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!cfg.file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, /*truncate=*/false));
    } catch (const spdlog::spdlog_ex& e) {
      return Status::io_error("failed opening log file '" + cfg.file + "': " + e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("somni", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
  spdlog::set_default_logger(logger);
  return Status::ok_status();
}

}  // namespace somni
