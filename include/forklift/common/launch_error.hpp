#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace forklift {

// Base of every failure reported by the launcher. Optionally carries the
// failure that caused it.
class LaunchError : public std::runtime_error {
 public:
  explicit LaunchError(
      const std::string& message, std::exception_ptr cause = nullptr)
      : std::runtime_error(message), cause_(std::move(cause)) {
  }

  [[nodiscard]] auto Cause() const -> const std::exception_ptr& {
    return cause_;
  }

  [[nodiscard]] auto HasCause() const -> bool {
    return cause_ != nullptr;
  }

 private:
  std::exception_ptr cause_;
};

// The LaunchSpec is self-contradictory or incomplete. Always raised before
// any external action is taken.
class ConfigurationError final : public LaunchError {
 public:
  using LaunchError::LaunchError;
};

// The unit could not be located or loaded in-process, or it exposes no
// entry point.
class LoadError final : public LaunchError {
 public:
  using LaunchError::LaunchError;
};

// The entry point ran and threw. Cause() is exactly what it threw.
class TargetExecutionError final : public LaunchError {
 public:
  using LaunchError::LaunchError;
};

// The child process could not be started at all.
class ProcessLaunchError final : public LaunchError {
 public:
  using LaunchError::LaunchError;
};

// The child exited with a non-zero status and the exit code was not ignored.
class ProcessExitError final : public LaunchError {
 public:
  ProcessExitError(const std::string& message, int exit_code)
      : LaunchError(message), exit_code_(exit_code) {
  }

  [[nodiscard]] auto ExitCode() const -> int {
    return exit_code_;
  }

 private:
  int exit_code_;
};

// Message of the error followed by one "caused by: ..." line per link of
// the cause chain.
auto FormatErrorChain(const LaunchError& error) -> std::string;

}  // namespace forklift
