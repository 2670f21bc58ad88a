#pragma once

#include <string>
#include <vector>

#include "forklift/common/os_family.hpp"
#include "forklift/launch/launch_spec.hpp"
#include "forklift/launch/runtime_locator.hpp"

namespace forklift::launch {

// Assemble the argv of a forked launch. Order is fixed:
//   1. runtime executable (spec override, else locator)
//   2. runtime arguments
//   3. -Xmx<max memory>
//   4. -D<name>=<value> per property
//   5. -classpath <path list>      (omitted when the class path is empty)
//   6. -jar <archive> | <entry point name>
//   7. program arguments
// Runtime options must precede the target selector or the runtime would
// hand them to the program.
//
// Pure. The spec must already be validated for forked mode.
auto BuildInvocation(
    const LaunchSpec& spec, const RuntimeLocator& locator,
    const common::OsFamilyClassifier& classifier) -> std::vector<std::string>;

// "-D<name>=<value>"
auto FormatPropertyFlag(const std::string& name, const std::string& value)
    -> std::string;

}  // namespace forklift::launch
