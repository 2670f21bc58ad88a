#include "forklift/launch/invocation_builder.hpp"

#include <string>
#include <vector>

#include <fmt/core.h>

#include "forklift/common/path_list.hpp"

namespace forklift::launch {

auto FormatPropertyFlag(const std::string& name, const std::string& value)
    -> std::string {
  return fmt::format("-D{}={}", name, value);
}

auto BuildInvocation(
    const LaunchSpec& spec, const RuntimeLocator& locator,
    const common::OsFamilyClassifier& classifier)
    -> std::vector<std::string> {
  std::vector<std::string> command;
  command.reserve(
      1 + spec.RuntimeArguments().size() + 1 +
      spec.EnvironmentProperties().Size() + 2 + 2 +
      spec.ProgramArguments().size());

  if (spec.RuntimeExecutable()) {
    command.push_back(*spec.RuntimeExecutable());
  } else {
    command.push_back(locator.ResolveRuntimeExecutable());
  }

  command.insert(
      command.end(), spec.RuntimeArguments().begin(),
      spec.RuntimeArguments().end());

  if (spec.MaxMemory()) {
    command.push_back(fmt::format("-Xmx{}", *spec.MaxMemory()));
  }

  for (const auto& [name, value] : spec.EnvironmentProperties()) {
    command.push_back(FormatPropertyFlag(name, value));
  }

  if (!spec.ClassPath().empty()) {
    command.emplace_back("-classpath");
    command.push_back(
        common::JoinPathList(
            spec.ClassPath(), common::PathListSeparator(classifier)));
  }

  if (spec.ArchivePath()) {
    command.emplace_back("-jar");
    command.push_back(spec.ArchivePath()->string());
  } else if (spec.EntryPointName()) {
    command.push_back(*spec.EntryPointName());
  }

  command.insert(
      command.end(), spec.ProgramArguments().begin(),
      spec.ProgramArguments().end());
  return command;
}

}  // namespace forklift::launch
