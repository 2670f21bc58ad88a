#include "forklift/common/path_list.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace forklift::common {

auto PathListSeparator(const OsFamilyClassifier& classifier) -> char {
  if (classifier.IsFamily(OsFamily::kDos) ||
      classifier.IsFamily(OsFamily::kNetware)) {
    return ';';
  }
  return ':';
}

auto JoinPathList(
    const std::vector<std::filesystem::path>& paths, char separator)
    -> std::string {
  std::string out;
  for (size_t i = 0; i < paths.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += paths[i].string();
  }
  return out;
}

auto SplitPathList(std::string_view list, char separator)
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> result;
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(separator, start);
    if (end == std::string_view::npos) {
      end = list.size();
    }
    if (end > start) {
      result.emplace_back(std::string(list.substr(start, end - start)));
    }
    start = end + 1;
  }
  return result;
}

}  // namespace forklift::common
