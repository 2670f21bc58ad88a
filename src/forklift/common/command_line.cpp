#include "forklift/common/command_line.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace forklift::common {

auto QuoteArgument(std::string_view arg) -> std::string {
  if (arg.find('"') != std::string_view::npos) {
    return fmt::format("'{}'", arg);
  }
  if (arg.empty() || arg.find_first_of(" \t") != std::string_view::npos) {
    return fmt::format("\"{}\"", arg);
  }
  return std::string(arg);
}

auto FormatCommandLine(const std::vector<std::string>& args) -> std::string {
  std::string out;
  for (const auto& arg : args) {
    if (!out.empty()) {
      out += ' ';
    }
    out += QuoteArgument(arg);
  }
  return out;
}

}  // namespace forklift::common
