#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "forklift/common/command_line.hpp"
#include "forklift/common/launch_error.hpp"
#include "forklift/launch/process_executor.hpp"

namespace forklift::launch {

namespace {

class FdGuard {
 public:
  explicit FdGuard(int fd) : fd_(fd) {
  }
  ~FdGuard() {
    Close();
  }

  FdGuard(const FdGuard&) = delete;
  auto operator=(const FdGuard&) -> FdGuard& = delete;
  FdGuard(FdGuard&&) = delete;
  auto operator=(FdGuard&&) -> FdGuard& = delete;

  void Close() {
    if (fd_ != -1) {
      close(fd_);
      fd_ = -1;
    }
  }

  [[nodiscard]] auto Get() const -> int {
    return fd_;
  }

 private:
  int fd_;
};

auto LaunchFailure(const std::string& program, int error)
    -> ProcessLaunchError {
  return ProcessLaunchError(
      fmt::format("cannot run '{}': {}", program, std::strerror(error)));
}

auto WaitForExit(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      throw ProcessLaunchError(
          fmt::format("waitpid() failed: {}", std::strerror(errno)));
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Child side of ForkExecIn. Only async-signal-safe calls from here on.
[[noreturn]] void ReportAndExit(int report_fd, int error) {
  ssize_t ignored = write(report_fd, &error, sizeof(error));
  static_cast<void>(ignored);
  _exit(127);
}

}  // namespace

void PosixProcessExecutor::Configure(
    std::optional<std::filesystem::path> working_directory,
    bool ignore_exit_code) {
  working_directory_ = std::move(working_directory);
  ignore_exit_code_ = ignore_exit_code;
}

void PosixProcessExecutor::SetCommand(std::vector<std::string> argv) {
  argv_ = std::move(argv);
}

auto PosixProcessExecutor::Spawn(std::vector<char*>& c_argv) const -> int {
  pid_t pid = 0;
  int spawn_result =
      posix_spawnp(&pid, c_argv[0], nullptr, nullptr, c_argv.data(), environ);
  if (spawn_result != 0) {
    throw LaunchFailure(argv_.front(), spawn_result);
  }
  return WaitForExit(pid);
}

// posix_spawn_file_actions_addchdir_np is a GNU extension, so a working
// directory goes through fork+exec. exec/chdir failures travel back over a
// close-on-exec pipe: EOF means the exec succeeded.
auto PosixProcessExecutor::ForkExecIn(std::vector<char*>& c_argv) const
    -> int {
  std::array<int, 2> pipe_fds{};
  if (pipe2(pipe_fds.data(), O_CLOEXEC) != 0) {
    throw ProcessLaunchError(
        fmt::format("pipe2() failed: {}", std::strerror(errno)));
  }
  FdGuard read_end(pipe_fds[0]);
  FdGuard write_end(pipe_fds[1]);

  pid_t pid = fork();
  if (pid == -1) {
    throw ProcessLaunchError(
        fmt::format("fork() failed: {}", std::strerror(errno)));
  }

  if (pid == 0) {
    if (chdir(working_directory_->c_str()) != 0) {
      ReportAndExit(write_end.Get(), errno);
    }
    execvp(c_argv[0], c_argv.data());
    ReportAndExit(write_end.Get(), errno);
  }

  write_end.Close();
  int child_error = 0;
  ssize_t n = 0;
  do {
    n = read(read_end.Get(), &child_error, sizeof(child_error));
  } while (n == -1 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_error))) {
    WaitForExit(pid);
    if (child_error == ENOENT || child_error == ENOTDIR) {
      std::error_code ec;
      if (!std::filesystem::is_directory(*working_directory_, ec)) {
        throw ProcessLaunchError(
            fmt::format(
                "cannot change to working directory '{}': {}",
                working_directory_->string(), std::strerror(child_error)));
      }
    }
    throw LaunchFailure(argv_.front(), child_error);
  }
  return WaitForExit(pid);
}

auto PosixProcessExecutor::Run() -> int {
  if (argv_.empty()) {
    throw ProcessLaunchError("no command to run");
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv_.size() + 1);
  for (auto& arg : argv_) {
    c_argv.push_back(arg.data());
  }
  c_argv.push_back(nullptr);

  int exit_code = working_directory_ ? ForkExecIn(c_argv) : Spawn(c_argv);

  if (exit_code != 0 && !ignore_exit_code_) {
    throw ProcessExitError(
        fmt::format(
            "'{}' exited with status {}", common::FormatCommandLine(argv_),
            exit_code),
        exit_code);
  }
  return exit_code;
}

auto MakePosixExecutorFactory() -> ExecutorFactory {
  return [] { return std::make_unique<PosixProcessExecutor>(); };
}

}  // namespace forklift::launch
