#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "forklift/common/diagnostic.hpp"
#include "forklift/config/launch_config.hpp"

namespace forklift::config {
namespace {

namespace fs = std::filesystem;

class LaunchConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    // Canonical so expected paths match what LoadConfig derives.
    fs::path tmp = fs::canonical(fs::temp_directory_path());
    root_ = tmp / ("forklift_config_test_" + std::to_string(rd()));
    fs::create_directories(root_);
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  auto WriteConfig(const std::string& content, const fs::path& dir = {})
      -> fs::path {
    fs::path target_dir = dir.empty() ? root_ : dir;
    fs::create_directories(target_dir);
    fs::path path = target_dir / kConfigFileName;
    std::ofstream out(path);
    out << content;
    return path;
  }

  static auto ErrorMessage(const Result<LaunchConfig>& result) -> std::string {
    return result ? std::string() : result.error().primary.message;
  }

  fs::path root_;
};

TEST_F(LaunchConfigTest, LoadsAllFields) {
  auto path = WriteConfig(R"(
[launch]
main = "demo.Hello"
fork = true
args = ["one", "two words"]
classpath = ["units", "/opt/units"]
working_dir = "work"
max_memory = "512m"
ignore_exit_code = true

[runtime]
executable = "/opt/jdk/bin/java"
args = ["-verbose"]

[properties]
"os.name" = "test"
)");

  auto config = LoadConfig(path);
  ASSERT_TRUE(config) << ErrorMessage(config);

  const auto& spec = config->spec;
  EXPECT_EQ(config->root_dir, root_);
  EXPECT_EQ(spec.EntryPointName(), std::optional<std::string>("demo.Hello"));
  EXPECT_FALSE(spec.ArchivePath().has_value());
  EXPECT_TRUE(spec.Forked());
  EXPECT_EQ(
      spec.ProgramArguments(), (std::vector<std::string>{"one", "two words"}));
  EXPECT_EQ(
      spec.ClassPath(),
      (std::vector<fs::path>{root_ / "units", "/opt/units"}));
  EXPECT_EQ(spec.WorkingDirectory(), std::optional<fs::path>(root_ / "work"));
  EXPECT_EQ(spec.MaxMemory(), std::optional<std::string>("512m"));
  EXPECT_TRUE(spec.IgnoreExitCode());
  EXPECT_EQ(
      spec.RuntimeExecutable(),
      std::optional<std::string>("/opt/jdk/bin/java"));
  EXPECT_EQ(spec.RuntimeArguments(), (std::vector<std::string>{"-verbose"}));
  EXPECT_EQ(
      spec.EnvironmentProperties().Get("os.name"),
      std::optional<std::string>("test"));
}

TEST_F(LaunchConfigTest, DefaultsWhenOnlyTargetGiven) {
  auto path = WriteConfig("[launch]\nmain = \"Main\"\n");

  auto config = LoadConfig(path);
  ASSERT_TRUE(config) << ErrorMessage(config);

  const auto& spec = config->spec;
  EXPECT_FALSE(spec.Forked());
  EXPECT_FALSE(spec.IgnoreExitCode());
  EXPECT_TRUE(spec.ClassPath().empty());
  EXPECT_TRUE(spec.ProgramArguments().empty());
  EXPECT_TRUE(spec.RuntimeArguments().empty());
  EXPECT_TRUE(spec.EnvironmentProperties().Empty());
  EXPECT_FALSE(spec.WorkingDirectory().has_value());
  EXPECT_FALSE(spec.MaxMemory().has_value());
  EXPECT_FALSE(spec.RuntimeExecutable().has_value());
}

TEST_F(LaunchConfigTest, ArchiveResolvedAgainstConfigDir) {
  auto path = WriteConfig(
      "[launch]\narchive = \"../dist/./tool.jar\"\nfork = true\n",
      root_ / "app");

  auto config = LoadConfig(path);
  ASSERT_TRUE(config) << ErrorMessage(config);

  EXPECT_FALSE(config->spec.EntryPointName().has_value());
  EXPECT_EQ(
      config->spec.ArchivePath(),
      std::optional<fs::path>(root_ / "dist" / "tool.jar"));
}

TEST_F(LaunchConfigTest, PropertiesKeepFileOrder) {
  auto path = WriteConfig(R"(
[launch]
main = "Main"

[properties]
zeta = "1"
alpha = "2"
"mid.name" = "3"
)");

  auto config = LoadConfig(path);
  ASSERT_TRUE(config) << ErrorMessage(config);

  std::vector<std::string> names;
  for (const auto& [name, value] : config->spec.EnvironmentProperties()) {
    names.push_back(name);
  }
  EXPECT_EQ(names, (std::vector<std::string>{"zeta", "alpha", "mid.name"}));
}

TEST_F(LaunchConfigTest, MissingLaunchSection) {
  auto path = WriteConfig("[runtime]\nexecutable = \"java\"\n");

  auto config = LoadConfig(path);
  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().primary.kind, DiagKind::kError);
  EXPECT_NE(
      config.error().primary.message.find("missing [launch] section"),
      std::string::npos);
}

TEST_F(LaunchConfigTest, MissingTarget) {
  auto path = WriteConfig("[launch]\nfork = true\n");

  auto config = LoadConfig(path);
  ASSERT_FALSE(config);
  EXPECT_NE(
      ErrorMessage(config).find("needs 'main' or 'archive'"),
      std::string::npos);
}

TEST_F(LaunchConfigTest, WrongTypes) {
  struct Case {
    std::string toml;
    std::string key;
  };
  std::vector<Case> cases = {
      {"[launch]\nmain = 3\n", "launch.main"},
      {"[launch]\nmain = \"M\"\nfork = \"yes\"\n", "launch.fork"},
      {"[launch]\nmain = \"M\"\nargs = \"a\"\n", "launch.args"},
      {"[launch]\nmain = \"M\"\nclasspath = [1, 2]\n", "launch.classpath"},
      {"[launch]\nmain = \"M\"\n[runtime]\nexecutable = false\n",
       "runtime.executable"},
      {"[launch]\nmain = \"M\"\n[properties]\nk = 1\n", "properties.k"},
  };

  for (const auto& c : cases) {
    auto config = LoadConfig(WriteConfig(c.toml));
    ASSERT_FALSE(config) << c.toml;
    EXPECT_NE(
        ErrorMessage(config).find("'" + c.key + "' must be"),
        std::string::npos)
        << ErrorMessage(config);
  }
}

TEST_F(LaunchConfigTest, ParseErrorIsHostError) {
  auto path = WriteConfig("[launch\nmain = \"M\"\n");

  auto config = LoadConfig(path);
  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(ErrorMessage(config).find("failed to parse"), std::string::npos);
}

TEST_F(LaunchConfigTest, FindConfigWalksUp) {
  auto path = WriteConfig("[launch]\nmain = \"M\"\n");
  fs::path nested = root_ / "a" / "b" / "c";
  fs::create_directories(nested);

  auto found = FindConfig(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, path);
}

TEST_F(LaunchConfigTest, FindConfigPrefersNearest) {
  WriteConfig("[launch]\nmain = \"Outer\"\n");
  auto inner = WriteConfig("[launch]\nmain = \"Inner\"\n", root_ / "sub");

  auto found = FindConfig(root_ / "sub");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, inner);
}

}  // namespace
}  // namespace forklift::config
