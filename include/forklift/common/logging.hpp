#pragma once

#include <memory>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace forklift {

// Logger used for advisory output (warnings about ignored settings, debug
// traces of what is about to run). Writes to stderr so stdout stays with
// the launched program. Not registered in the spdlog registry.
auto MakeDefaultLogger(
    spdlog::level::level_enum level = spdlog::level::warn,
    const std::string& name = "forklift") -> std::shared_ptr<spdlog::logger>;

// Logger that drops everything.
auto MakeNullLogger() -> std::shared_ptr<spdlog::logger>;

}  // namespace forklift
