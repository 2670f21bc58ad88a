#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "forklift/common/os_family.hpp"
#include "forklift/launch/in_process_loader.hpp"
#include "forklift/launch/launch_spec.hpp"
#include "forklift/launch/process_executor.hpp"
#include "forklift/launch/runtime_locator.hpp"

namespace forklift::launch {

// Public entry point: validates a LaunchSpec and runs it either in a child
// process or in the current one.
//
// Holds no per-launch state. Execute() may be called concurrently as long
// as each caller passes its own LaunchSpec; every forked launch gets a
// fresh executor from the factory.
class Launcher {
 public:
  Launcher(
      ExecutorFactory executor_factory, std::shared_ptr<spdlog::logger> logger,
      const common::OsFamilyClassifier& classifier, RuntimeLocator locator);

  // Host platform, POSIX executor, runtime home from the environment.
  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger)
      -> Launcher;

  // Forked: the child's exit code. In-process: nullopt.
  auto Execute(const LaunchSpec& spec) const -> std::optional<int>;

  // Throws ConfigurationError unless exactly one of entry point name and
  // archive is set. Nothing is started before validation passes.
  auto ExecuteForked(const LaunchSpec& spec) const -> int;

  void ExecuteInProcess(const LaunchSpec& spec) const;

  // The argv ExecuteForked would run, after the same validation.
  [[nodiscard]] auto PlanForked(const LaunchSpec& spec) const
      -> std::vector<std::string>;

 private:
  static void ValidateForked(const LaunchSpec& spec);

  ExecutorFactory executor_factory_;
  std::shared_ptr<spdlog::logger> logger_;
  const common::OsFamilyClassifier* classifier_;
  RuntimeLocator locator_;
  InProcessLoader in_process_;
};

}  // namespace forklift::launch
