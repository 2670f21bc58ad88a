#include "forklift/common/logging.hpp"

#include <memory>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace forklift {

auto MakeDefaultLogger(spdlog::level::level_enum level, const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_pattern("[%n][%H:%M:%S][%^%l%$] %v");
  logger->set_level(level);
  return logger;
}

auto MakeNullLogger() -> std::shared_ptr<spdlog::logger> {
  return std::make_shared<spdlog::logger>(
      "forklift-null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

}  // namespace forklift
