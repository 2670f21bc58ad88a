#include <argparse/argparse.hpp>
#include <cstddef>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/common.h>

#include "forklift/common/command_line.hpp"
#include "forklift/common/diagnostic.hpp"
#include "forklift/common/launch_error.hpp"
#include "forklift/common/logging.hpp"
#include "forklift/common/os_family.hpp"
#include "forklift/common/path_list.hpp"
#include "forklift/config/launch_config.hpp"
#include "forklift/launch/launch_spec.hpp"
#include "forklift/launch/launcher.hpp"
#include "forklift/launch/runtime_locator.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

struct PreprocessedArgs {
  std::vector<std::string> argv;
  // Collected from attached -J<arg> forms; argparse would read a value
  // such as "-verbose" as an option.
  std::vector<std::string> runtime_args;
};

// Options that consume the following token.
const std::set<std::string_view> kValueOptions = {
    "-C",        "--jar",        "-cp",   "--classpath", "-D",
    "--runtime", "--max-memory", "--cwd", "--config",    "--home",
};

const std::set<std::string_view> kSubcommands = {"run", "print-runtime"};

// Split attached flag forms (-Dname=value -> -D name=value) and pull out
// -J<arg>. Stops at the first positional after the subcommand: everything
// from the unit name on belongs to the launched program and is kept
// verbatim.
auto PreprocessArgs(std::span<char*> argv) -> PreprocessedArgs {
  PreprocessedArgs result;
  bool expect_value = false;
  bool seen_subcommand = false;
  size_t i = 0;

  for (; i < argv.size(); ++i) {
    std::string_view arg = argv[i];
    if (i == 0 || expect_value) {
      result.argv.emplace_back(arg);
      expect_value = false;
      continue;
    }
    if (!arg.starts_with("-")) {
      if (!seen_subcommand && kSubcommands.contains(arg)) {
        seen_subcommand = true;
        result.argv.emplace_back(arg);
        continue;
      }
      break;
    }
    if (arg.size() > 2 && arg.starts_with("-J")) {
      result.runtime_args.emplace_back(arg.substr(2));
      continue;
    }
    if (arg.size() > 2 && arg.starts_with("-D")) {
      result.argv.emplace_back(arg.substr(0, 2));
      result.argv.emplace_back(arg.substr(2));
      continue;
    }
    result.argv.emplace_back(arg);
    expect_value = kValueOptions.contains(arg);
  }

  for (; i < argv.size(); ++i) {
    result.argv.emplace_back(argv[i]);
  }
  return result;
}

auto ParseProperty(const std::string& text)
    -> std::optional<std::pair<std::string, std::string>> {
  auto eq = text.find('=');
  if (eq == 0) {
    return std::nullopt;
  }
  if (eq == std::string::npos) {
    return std::pair{text, std::string()};
  }
  return std::pair{text.substr(0, eq), text.substr(eq + 1)};
}

// An explicit --config always loads; otherwise forklift.toml is only looked
// up when the command line names nothing to run.
auto LoadOptionalConfig(
    const argparse::ArgumentParser& cmd, bool has_cli_target)
    -> forklift::Result<std::optional<forklift::config::LaunchConfig>> {
  std::optional<fs::path> config_path;
  if (auto explicit_path = cmd.present<std::string>("--config")) {
    config_path = *explicit_path;
  } else if (!has_cli_target) {
    config_path = forklift::config::FindConfig();
  }
  if (!config_path) {
    return std::nullopt;
  }

  auto config = forklift::config::LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::move(*config);
}

// Build the spec: forklift.toml first, then command-line values. A target
// given on the command line replaces the config's target and arguments;
// list options extend the config's lists.
auto BuildSpec(
    const argparse::ArgumentParser& cmd,
    const std::vector<std::string>& runtime_args)
    -> std::optional<forklift::launch::LaunchSpec> {
  auto target = cmd.present<std::vector<std::string>>("target");
  auto jar = cmd.present<std::string>("--jar");
  bool has_cli_target = jar.has_value() || (target && !target->empty());

  auto config = LoadOptionalConfig(cmd, has_cli_target);
  if (!config) {
    forklift::driver::PrintDiagnostic(config.error());
    return std::nullopt;
  }

  forklift::launch::LaunchSpec spec;
  if (*config) {
    spec = (*config)->spec;
  }

  if (has_cli_target) {
    std::vector<std::string> program_args =
        target.value_or(std::vector<std::string>{});
    if (jar) {
      spec.SetEntryPointName(std::nullopt);
      spec.SetArchivePath(fs::absolute(*jar));
    } else {
      spec.SetArchivePath(std::nullopt);
      spec.SetEntryPointName(program_args.front());
      program_args.erase(program_args.begin());
    }
    spec.ProgramArguments() = std::move(program_args);
  }

  if (cmd.get<bool>("--fork")) {
    spec.SetForked(true);
  }
  if (cmd.get<bool>("--ignore-exit-code")) {
    spec.SetIgnoreExitCode(true);
  }
  if (auto runtime = cmd.present<std::string>("--runtime")) {
    spec.SetRuntimeExecutable(*runtime);
  }
  if (auto max_memory = cmd.present<std::string>("--max-memory")) {
    spec.SetMaxMemory(*max_memory);
  }
  if (auto cwd = cmd.present<std::string>("--cwd")) {
    spec.SetWorkingDirectory(fs::absolute(*cwd));
  }

  const char separator =
      forklift::common::PathListSeparator(forklift::common::HostClassifier());
  if (auto lists = cmd.present<std::vector<std::string>>("-cp")) {
    for (const auto& list : *lists) {
      for (auto& entry : forklift::common::SplitPathList(list, separator)) {
        spec.ClassPath().push_back(std::move(entry));
      }
    }
  }

  if (auto props = cmd.present<std::vector<std::string>>("-D")) {
    for (const auto& text : *props) {
      auto property = ParseProperty(text);
      if (!property) {
        forklift::driver::PrintError(
            std::format("invalid property '-D{}': missing name", text));
        return std::nullopt;
      }
      spec.EnvironmentProperties().Set(property->first, property->second);
    }
  }

  spec.RuntimeArguments().insert(
      spec.RuntimeArguments().end(), runtime_args.begin(), runtime_args.end());

  if (!spec.EntryPointName() && !spec.ArchivePath()) {
    forklift::driver::PrintError(
        "nothing to run (give a unit name, --jar, or a forklift.toml)");
    return std::nullopt;
  }
  return spec;
}

auto RunCommand(
    const argparse::ArgumentParser& cmd,
    const std::vector<std::string>& runtime_args) -> int {
  auto spec = BuildSpec(cmd, runtime_args);
  if (!spec) {
    return 1;
  }

  auto level = cmd.get<bool>("--verbose") ? spdlog::level::debug
                                           : spdlog::level::warn;
  auto launcher = forklift::launch::Launcher::CreateDefault(
      forklift::MakeDefaultLogger(level));

  try {
    if (cmd.get<bool>("--dry-run")) {
      if (!spec->Forked()) {
        forklift::driver::PrintWarning(
            "--dry-run only plans forked launches (add --fork)");
        return 0;
      }
      fmt::print(
          "{}\n",
          forklift::common::FormatCommandLine(launcher.PlanForked(*spec)));
      return 0;
    }

    auto exit_code = launcher.Execute(*spec);
    return exit_code.value_or(0);
  } catch (const forklift::ProcessExitError& e) {
    forklift::driver::PrintError(e.what());
    return e.ExitCode();
  } catch (const forklift::LaunchError& e) {
    forklift::driver::PrintError(forklift::FormatErrorChain(e));
    return 1;
  }
}

auto PrintRuntimeCommand(const argparse::ArgumentParser& cmd) -> int {
  fs::path home = forklift::launch::DefaultRuntimeHome();
  if (auto explicit_home = cmd.present<std::string>("--home")) {
    home = *explicit_home;
  }
  forklift::launch::RuntimeLocator locator(
      forklift::common::HostClassifier(), home);
  fmt::print("{}\n", locator.ResolveRuntimeExecutable());
  return 0;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  auto args = PreprocessArgs(std::span<char*>(argv, static_cast<size_t>(argc)));

  argparse::ArgumentParser program("forklift", "0.1.0");
  program.add_description(
      "Run a program unit in this process or in a forked runtime");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Run a unit or an archive");
  run_cmd.add_argument("--fork")
      .default_value(false)
      .implicit_value(true)
      .help("Run in a child runtime process");
  run_cmd.add_argument("--jar").help("Run an archive (forked only)");
  run_cmd.add_argument("-cp", "--classpath")
      .append()
      .help("Class path list (repeatable)");
  run_cmd.add_argument("-D").append().help("Property name=value (repeatable)");
  run_cmd.add_argument("--runtime").help("Runtime executable");
  run_cmd.add_argument("--max-memory").help("Maximum heap, e.g. 512m");
  run_cmd.add_argument("--cwd").help("Working directory of the child");
  run_cmd.add_argument("--ignore-exit-code")
      .default_value(false)
      .implicit_value(true)
      .help("Report a non-zero exit code without failing");
  run_cmd.add_argument("--config").help(
      "Launch file (default: nearest forklift.toml)");
  run_cmd.add_argument("--dry-run")
      .default_value(false)
      .implicit_value(true)
      .help("Print the forked command instead of running it");
  run_cmd.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log debug output");
  run_cmd.add_argument("target").remaining().help(
      "Unit name followed by program arguments (-J<arg> passes a runtime "
      "argument)");

  // Subcommand: print-runtime
  argparse::ArgumentParser runtime_cmd("print-runtime");
  runtime_cmd.add_description("Print the default runtime executable");
  runtime_cmd.add_argument("--home").help(
      "Runtime home whose parent holds bin/ (default: FORKLIFT_RUNTIME_HOME)");

  program.add_subparser(run_cmd);
  program.add_subparser(runtime_cmd);

  try {
    program.parse_args(args.argv);
  } catch (const std::exception& err) {
    forklift::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      forklift::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("run")) {
    return RunCommand(run_cmd, args.runtime_args);
  }

  if (program.is_subcommand_used("print-runtime")) {
    return PrintRuntimeCommand(runtime_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
