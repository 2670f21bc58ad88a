#include "forklift/launch/in_process_loader.hpp"

#include <exception>
#include <optional>
#include <string>

#include <fmt/core.h>

#include "forklift/common/command_line.hpp"
#include "forklift/common/launch_error.hpp"
#include "forklift/launch/entry_point.hpp"
#include "forklift/launch/unit_loader.hpp"

namespace forklift::launch {

void InProcessLoader::WarnIgnoredSettings(const LaunchSpec& spec) const {
  if (!spec.RuntimeArguments().empty()) {
    logger_->warn("Runtime arguments ignored when running in-process.");
  }
  if (spec.WorkingDirectory()) {
    logger_->warn("Working directory ignored when running in-process.");
  }
  if (!spec.EnvironmentProperties().Empty()) {
    logger_->warn("Environment properties ignored when running in-process.");
  }
  if (spec.MaxMemory()) {
    logger_->warn("Max memory ignored when running in-process.");
  }
  if (spec.RuntimeExecutable()) {
    logger_->warn("Runtime executable ignored when running in-process.");
  }
}

void InProcessLoader::Invoke(const LaunchSpec& spec) const {
  if (!spec.EntryPointName() || spec.EntryPointName()->empty()) {
    throw ConfigurationError("Entry point name must not be empty.");
  }
  if (spec.ArchivePath()) {
    throw ConfigurationError("Cannot execute an archive in non-forked mode.");
  }
  WarnIgnoredSettings(spec);

  const std::string& name = *spec.EntryPointName();
  const ArgumentList& args = spec.ProgramArguments();
  logger_->debug(
      "Running in-process: {} {}", name, common::FormatCommandLine(args));

  // Scoped to this call; must outlive the entry point invocation.
  std::optional<UnitLoader> loader;
  ResolvedUnit unit;
  try {
    if (spec.ClassPath().empty()) {
      unit = ResolveAmbientUnit(name);
    } else {
      loader.emplace(spec.ClassPath());
      unit = loader->Resolve(name);
    }
  } catch (const std::exception&) {
    throw LoadError(
        fmt::format("Could not find unit \"{}\".", name),
        std::current_exception());
  }

  if (unit.entry == nullptr) {
    throw LoadError(
        fmt::format(
            "Unit \"{}\" has no entry point ({} not exported by {}).", name,
            EntrySymbolName(name), unit.source.string()));
  }
  if (!unit.source.empty()) {
    logger_->debug("Loaded {} from {}", name, unit.source.string());
  }

  try {
    unit.entry(args);
  } catch (...) {
    throw TargetExecutionError(
        fmt::format("Could not execute unit \"{}\".", name),
        std::current_exception());
  }
}

}  // namespace forklift::launch
