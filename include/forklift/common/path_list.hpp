#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "forklift/common/os_family.hpp"

namespace forklift::common {

// Path-list separator for the given platform: ';' on DOS-like and NetWare
// families, ':' everywhere else.
auto PathListSeparator(const OsFamilyClassifier& classifier) -> char;

// Join paths into a single path-list string. Order is preserved.
auto JoinPathList(
    const std::vector<std::filesystem::path>& paths, char separator)
    -> std::string;

// Split a path-list string. Empty elements are dropped.
auto SplitPathList(std::string_view list, char separator)
    -> std::vector<std::filesystem::path>;

}  // namespace forklift::common
