#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace forklift::common {

// Name -> value map that iterates in insertion order. Setting an existing
// name replaces its value in place.
class PropertyMap {
 public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  void Set(std::string name, std::string value);

  // Returns true if the name was present.
  auto Remove(std::string_view name) -> bool;

  [[nodiscard]] auto Get(std::string_view name) const
      -> std::optional<std::string>;

  [[nodiscard]] auto Contains(std::string_view name) const -> bool {
    return Get(name).has_value();
  }

  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

  [[nodiscard]] auto Empty() const -> bool {
    return entries_.empty();
  }

  void Clear() {
    entries_.clear();
  }

  [[nodiscard]] auto begin() const -> const_iterator {
    return entries_.begin();
  }
  [[nodiscard]] auto end() const -> const_iterator {
    return entries_.end();
  }

  auto operator==(const PropertyMap&) const -> bool = default;

 private:
  std::vector<Entry> entries_;
};

}  // namespace forklift::common
