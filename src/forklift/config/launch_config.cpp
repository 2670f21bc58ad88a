#include "forklift/config/launch_config.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <toml++/toml.hpp>

#include "forklift/common/diagnostic.hpp"

namespace forklift::config {

namespace fs = std::filesystem;

namespace {

auto TypeError(
    const fs::path& config_path, std::string_view key, std::string_view type)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::Error(
          std::format(
              "{}: '{}' must be {}", config_path.string(), key, type)));
}

template <typename T>
auto ReadScalar(
    const toml::table& table, std::string_view section, std::string_view key,
    const fs::path& config_path, std::string_view type_name)
    -> Result<std::optional<T>> {
  const toml::node* node = table.get(key);
  if (node == nullptr) {
    return std::optional<T>{};
  }
  auto value = node->value<T>();
  if (!value) {
    return TypeError(
        config_path, std::format("{}.{}", section, key), type_name);
  }
  return std::optional<T>{*value};
}

auto ReadStringArray(
    const toml::table& table, std::string_view section, std::string_view key,
    const fs::path& config_path) -> Result<std::vector<std::string>> {
  std::vector<std::string> result;
  const toml::node* node = table.get(key);
  if (node == nullptr) {
    return result;
  }
  const toml::array* arr = node->as_array();
  if (arr == nullptr) {
    return TypeError(
        config_path, std::format("{}.{}", section, key), "an array of strings");
  }
  for (const auto& elem : *arr) {
    auto str = elem.value<std::string>();
    if (!str) {
      return TypeError(
          config_path, std::format("{}.{}", section, key),
          "an array of strings");
    }
    result.push_back(*str);
  }
  return result;
}

auto ResolveAgainst(const fs::path& root, const std::string& path)
    -> fs::path {
  fs::path p = path;
  if (p.is_relative()) {
    p = root / p;
  }
  return p.lexically_normal();
}

auto LoadLaunchSection(
    const toml::table& launch, const fs::path& config_path,
    LaunchConfig& config) -> Result<void> {
  launch::LaunchSpec& spec = config.spec;

  auto entry = ReadScalar<std::string>(
      launch, "launch", "main", config_path, "a string");
  if (!entry) return std::unexpected(entry.error());
  auto archive = ReadScalar<std::string>(
      launch, "launch", "archive", config_path, "a string");
  if (!archive) return std::unexpected(archive.error());
  if (!*entry && !*archive) {
    return std::unexpected(
        Diagnostic::Error(
            std::format(
                "{}: [launch] needs 'main' or 'archive'",
                config_path.string())));
  }
  if (*entry) {
    spec.SetEntryPointName(**entry);
  }
  if (*archive) {
    spec.SetArchivePath(ResolveAgainst(config.root_dir, **archive));
  }

  auto fork = ReadScalar<bool>(
      launch, "launch", "fork", config_path, "a boolean");
  if (!fork) return std::unexpected(fork.error());
  spec.SetForked(fork->value_or(false));

  auto args = ReadStringArray(launch, "launch", "args", config_path);
  if (!args) return std::unexpected(args.error());
  spec.ProgramArguments() = std::move(*args);

  auto classpath = ReadStringArray(launch, "launch", "classpath", config_path);
  if (!classpath) return std::unexpected(classpath.error());
  for (const auto& item : *classpath) {
    spec.ClassPath().push_back(ResolveAgainst(config.root_dir, item));
  }

  auto working_dir = ReadScalar<std::string>(
      launch, "launch", "working_dir", config_path, "a string");
  if (!working_dir) return std::unexpected(working_dir.error());
  if (*working_dir) {
    spec.SetWorkingDirectory(ResolveAgainst(config.root_dir, **working_dir));
  }

  auto max_memory = ReadScalar<std::string>(
      launch, "launch", "max_memory", config_path, "a string");
  if (!max_memory) return std::unexpected(max_memory.error());
  spec.SetMaxMemory(*max_memory);

  auto ignore_exit_code = ReadScalar<bool>(
      launch, "launch", "ignore_exit_code", config_path, "a boolean");
  if (!ignore_exit_code) return std::unexpected(ignore_exit_code.error());
  spec.SetIgnoreExitCode(ignore_exit_code->value_or(false));

  return {};
}

auto LoadRuntimeSection(
    const toml::table& runtime, const fs::path& config_path,
    launch::LaunchSpec& spec) -> Result<void> {
  auto executable = ReadScalar<std::string>(
      runtime, "runtime", "executable", config_path, "a string");
  if (!executable) return std::unexpected(executable.error());
  spec.SetRuntimeExecutable(*executable);

  auto args = ReadStringArray(runtime, "runtime", "args", config_path);
  if (!args) return std::unexpected(args.error());
  spec.RuntimeArguments() = std::move(*args);
  return {};
}

auto LoadPropertiesSection(
    const toml::table& properties, const fs::path& config_path,
    launch::LaunchSpec& spec) -> Result<void> {
  // toml::table iterates in key order, so walk by source position to keep
  // the order of the file.
  std::vector<std::pair<toml::source_position, std::string>> ordered;
  for (auto&& [key, node] : properties) {
    auto value = node.value<std::string>();
    if (!value) {
      return TypeError(
          config_path, std::format("properties.{}", key.str()), "a string");
    }
    ordered.emplace_back(key.source().begin, std::string(key.str()));
  }
  std::ranges::sort(ordered, [](const auto& a, const auto& b) {
    return a.first < b.first;
  });
  for (const auto& [pos, name] : ordered) {
    spec.EnvironmentProperties().Set(
        name, *properties.get(name)->value<std::string>());
  }
  return {};
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<LaunchConfig> {
  LaunchConfig config;
  config.root_dir = fs::absolute(config_path).parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  const toml::table* launch = tbl["launch"].as_table();
  if (launch == nullptr) {
    return std::unexpected(
        Diagnostic::Error(
            std::format("{}: missing [launch] section", config_path.string())));
  }
  if (auto r = LoadLaunchSection(*launch, config_path, config); !r) {
    return std::unexpected(r.error());
  }

  if (const toml::table* runtime = tbl["runtime"].as_table()) {
    if (auto r = LoadRuntimeSection(*runtime, config_path, config.spec); !r) {
      return std::unexpected(r.error());
    }
  }

  if (const toml::table* properties = tbl["properties"].as_table()) {
    if (auto r = LoadPropertiesSection(*properties, config_path, config.spec);
        !r) {
      return std::unexpected(r.error());
    }
  }

  return config;
}

}  // namespace forklift::config
