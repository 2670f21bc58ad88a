#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace forklift::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(const std::string& text) const -> bool {
    return output.find(text) != std::string::npos;
  }
};

// Test fixture for CLI integration tests
//
// Runs the forklift binary from a fresh temporary directory, so a
// forklift.toml written by one test is never seen by another.
//
// Usage:
//   TEST_F(CliTest, MyTest) {
//     auto result = Run({"run", "--fork", "--dry-run", "Main"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run forklift with given arguments from the test directory
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Run forklift from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
};

}  // namespace forklift::test
