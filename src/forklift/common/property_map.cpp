#include "forklift/common/property_map.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace forklift::common {

void PropertyMap::Set(std::string name, std::string value) {
  auto it = std::ranges::find(entries_, name, &Entry::first);
  if (it != entries_.end()) {
    it->second = std::move(value);
    return;
  }
  entries_.emplace_back(std::move(name), std::move(value));
}

auto PropertyMap::Remove(std::string_view name) -> bool {
  auto it = std::ranges::find(entries_, name, &Entry::first);
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

auto PropertyMap::Get(std::string_view name) const
    -> std::optional<std::string> {
  auto it = std::ranges::find(entries_, name, &Entry::first);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace forklift::common
