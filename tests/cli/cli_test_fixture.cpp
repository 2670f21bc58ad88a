#include "tests/cli/cli_test_fixture.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace forklift::test {
namespace {

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// Single-quote for sh; embedded quotes become '\''.
auto ShellQuote(const std::string& arg) -> std::string {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

// Execute command and capture output
// Uses popen to capture combined stdout/stderr
auto ExecuteCommand(const std::string& cmd) -> std::pair<int, std::string> {
  std::string output;
  std::array<char, 4096> buffer{};

  FILE* pipe = popen(cmd.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, "Failed to execute command"};
  }

  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }

  int status = pclose(pipe);
  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  return {exit_code, output};
}

}  // namespace

void CliTestFixture::SetUp() {
  auto tmp = std::filesystem::canonical(std::filesystem::temp_directory_path());
  test_dir_ = tmp / ("forklift_cli_test_" + GenerateRandomSuffix());
  std::filesystem::create_directories(test_dir_);
}

void CliTestFixture::TearDown() {
  if (!test_dir_.empty() && std::filesystem::exists(test_dir_)) {
    std::filesystem::remove_all(test_dir_);
  }
}

auto CliTestFixture::Run(const std::vector<std::string>& args) -> CliResult {
  return RunIn(test_dir_, args);
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, const std::vector<std::string>& args)
    -> CliResult {
  std::ostringstream cmd;
  cmd << "cd " << ShellQuote(dir.string()) << " && "
      << ShellQuote(FORKLIFT_BIN);
  for (const auto& arg : args) {
    cmd << " " << ShellQuote(arg);
  }
  // Redirect stderr to stdout so we capture both
  cmd << " 2>&1";

  auto [exit_code, output] = ExecuteCommand(cmd.str());
  return CliResult{.exit_code = exit_code, .output = output};
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  if (!out) {
    throw std::runtime_error("Failed to create file: " + full_path.string());
  }
  out << content;
}

auto CliTestFixture::ReadFile(const std::filesystem::path& relative_path) const
    -> std::string {
  auto full_path = test_dir_ / relative_path;
  std::ifstream in(full_path);
  if (!in) {
    throw std::runtime_error("Failed to read file: " + full_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace forklift::test
