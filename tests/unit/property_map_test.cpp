#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "forklift/common/property_map.hpp"

namespace forklift::common {
namespace {

auto Entries(const PropertyMap& map)
    -> std::vector<std::pair<std::string, std::string>> {
  return {map.begin(), map.end()};
}

TEST(PropertyMapTest, IteratesInInsertionOrder) {
  PropertyMap map;
  map.Set("zeta", "1");
  map.Set("alpha", "2");
  map.Set("mid", "3");

  std::vector<std::pair<std::string, std::string>> expected = {
      {"zeta", "1"}, {"alpha", "2"}, {"mid", "3"}};
  EXPECT_EQ(Entries(map), expected);
}

TEST(PropertyMapTest, SetReplacesInPlace) {
  PropertyMap map;
  map.Set("a", "1");
  map.Set("b", "2");
  map.Set("a", "3");

  std::vector<std::pair<std::string, std::string>> expected = {
      {"a", "3"}, {"b", "2"}};
  EXPECT_EQ(Entries(map), expected);
  EXPECT_EQ(map.Size(), 2);
}

TEST(PropertyMapTest, GetAndRemove) {
  PropertyMap map;
  map.Set("os.name", "test");
  map.Set("empty", "");

  EXPECT_EQ(map.Get("os.name"), "test");
  EXPECT_EQ(map.Get("empty"), "");
  EXPECT_FALSE(map.Get("missing").has_value());

  EXPECT_TRUE(map.Remove("os.name"));
  EXPECT_FALSE(map.Remove("os.name"));
  EXPECT_FALSE(map.Contains("os.name"));
  EXPECT_EQ(map.Size(), 1);

  map.Clear();
  EXPECT_TRUE(map.Empty());
}

}  // namespace
}  // namespace forklift::common
