#include "forklift/launch/entry_point.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace forklift::launch {

namespace {

auto IsSymbolChar(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

}  // namespace

auto EntrySymbolName(std::string_view unit_name) -> std::string {
  std::string symbol(kEntrySymbolPrefix);
  symbol.reserve(symbol.size() + unit_name.size());
  for (char c : unit_name) {
    symbol += IsSymbolChar(c) ? c : '_';
  }
  return symbol;
}

auto UnitRelativePath(std::string_view unit_name) -> std::filesystem::path {
  std::string relative(unit_name);
  for (char& c : relative) {
    if (c == '.') {
      c = '/';
    }
  }
  relative += kUnitFileSuffix;
  return std::filesystem::path(relative);
}

}  // namespace forklift::launch
