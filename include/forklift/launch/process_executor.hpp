#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forklift::launch {

// Runs one command to completion. An instance serves a single launch.
class ProcessExecutor {
 public:
  ProcessExecutor() = default;
  virtual ~ProcessExecutor() = default;

  ProcessExecutor(const ProcessExecutor&) = delete;
  auto operator=(const ProcessExecutor&) -> ProcessExecutor& = delete;
  ProcessExecutor(ProcessExecutor&&) = delete;
  auto operator=(ProcessExecutor&&) -> ProcessExecutor& = delete;

  virtual void Configure(
      std::optional<std::filesystem::path> working_directory,
      bool ignore_exit_code) = 0;

  // argv[0] is the program, looked up in PATH when it has no slash.
  virtual void SetCommand(std::vector<std::string> argv) = 0;

  // Blocks until the child exits and returns its exit code. Throws
  // ProcessLaunchError if it cannot be started.
  virtual auto Run() -> int = 0;
};

using ExecutorFactory = std::function<std::unique_ptr<ProcessExecutor>()>;

// POSIX executor. The child inherits stdin/stdout/stderr and the
// environment.
//
// Exit status: the child's exit code, or 128 + signal number when it was
// killed by a signal. Unless exit codes are ignored, a non-zero status
// throws ProcessExitError.
class PosixProcessExecutor final : public ProcessExecutor {
 public:
  void Configure(
      std::optional<std::filesystem::path> working_directory,
      bool ignore_exit_code) override;
  void SetCommand(std::vector<std::string> argv) override;
  auto Run() -> int override;

 private:
  auto Spawn(std::vector<char*>& c_argv) const -> int;
  auto ForkExecIn(std::vector<char*>& c_argv) const -> int;

  std::optional<std::filesystem::path> working_directory_;
  bool ignore_exit_code_ = false;
  std::vector<std::string> argv_;
};

auto MakePosixExecutorFactory() -> ExecutorFactory;

}  // namespace forklift::launch
