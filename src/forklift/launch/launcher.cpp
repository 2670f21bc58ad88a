#include "forklift/launch/launcher.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "forklift/common/command_line.hpp"
#include "forklift/common/internal_error.hpp"
#include "forklift/common/launch_error.hpp"
#include "forklift/launch/invocation_builder.hpp"

namespace forklift::launch {

Launcher::Launcher(
    ExecutorFactory executor_factory, std::shared_ptr<spdlog::logger> logger,
    const common::OsFamilyClassifier& classifier, RuntimeLocator locator)
    : executor_factory_(std::move(executor_factory)),
      logger_(std::move(logger)),
      classifier_(&classifier),
      locator_(std::move(locator)),
      in_process_(logger_) {
}

auto Launcher::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> Launcher {
  const common::OsFamilyClassifier& host = common::HostClassifier();
  return Launcher(
      MakePosixExecutorFactory(), std::move(logger), host,
      RuntimeLocator(host, DefaultRuntimeHome()));
}

void Launcher::ValidateForked(const LaunchSpec& spec) {
  const bool has_entry =
      spec.EntryPointName() && !spec.EntryPointName()->empty();
  const bool has_archive = spec.ArchivePath().has_value();
  if (has_entry && has_archive) {
    throw ConfigurationError(
        "Only one of entry point name and archive can be set.");
  }
  if (!has_entry && !has_archive) {
    throw ConfigurationError("Entry point name must not be empty.");
  }
}

auto Launcher::PlanForked(const LaunchSpec& spec) const
    -> std::vector<std::string> {
  ValidateForked(spec);
  return BuildInvocation(spec, locator_, *classifier_);
}

auto Launcher::ExecuteForked(const LaunchSpec& spec) const -> int {
  std::vector<std::string> command = PlanForked(spec);

  std::unique_ptr<ProcessExecutor> executor = executor_factory_();
  if (!executor) {
    common::ThrowInternalError(
        "Launcher::ExecuteForked", "executor factory returned null");
  }
  logger_->debug("Executing: {}", common::FormatCommandLine(command));
  if (spec.WorkingDirectory()) {
    logger_->debug("Working directory: {}", spec.WorkingDirectory()->string());
  }

  executor->Configure(spec.WorkingDirectory(), spec.IgnoreExitCode());
  executor->SetCommand(std::move(command));
  return executor->Run();
}

void Launcher::ExecuteInProcess(const LaunchSpec& spec) const {
  in_process_.Invoke(spec);
}

auto Launcher::Execute(const LaunchSpec& spec) const -> std::optional<int> {
  if (spec.Forked()) {
    return ExecuteForked(spec);
  }
  ExecuteInProcess(spec);
  return std::nullopt;
}

}  // namespace forklift::launch
