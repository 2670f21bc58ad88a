#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace forklift::common {

// Quote a single argument for display. Arguments containing a double quote
// are wrapped in single quotes; arguments containing whitespace (or empty
// ones) in double quotes; everything else is returned unchanged.
//
// Display only. The launcher never passes command lines through a shell.
auto QuoteArgument(std::string_view arg) -> std::string;

// Space-joined, quoted rendering of an argument vector.
auto FormatCommandLine(const std::vector<std::string>& args) -> std::string;

}  // namespace forklift::common
