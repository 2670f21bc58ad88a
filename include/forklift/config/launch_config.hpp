#pragma once

#include <filesystem>
#include <optional>

#include "forklift/common/diagnostic.hpp"
#include "forklift/launch/launch_spec.hpp"

namespace forklift::config {

inline constexpr const char* kConfigFileName = "forklift.toml";

struct LaunchConfig {
  launch::LaunchSpec spec;

  // Directory where forklift.toml was found. Relative paths in the file
  // are already resolved against it.
  std::filesystem::path root_dir;
};

// Search for forklift.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse forklift.toml.
//
//   [launch]      main | archive (one required), fork, args, classpath,
//                 working_dir, max_memory, ignore_exit_code
//   [runtime]     executable, args
//   [properties]  name = "value" pairs, kept in file order
//
// Returns an error Diagnostic on parse errors, missing [launch] target or
// values of the wrong type. Having both main and archive is not an error
// here; the launcher rejects it for forked runs.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<LaunchConfig>;

}  // namespace forklift::config
