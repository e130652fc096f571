#include "sandbox/id_map.hpp"

#include "gtest/gtest.h"

namespace {

using namespace sandbox;

TEST(IdMapTest, FindsRangeByName) {
  auto range = FindSubordinateRange(
      "root:100000:65536\nrunner:165536:65536\n", "runner", 1000);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->first, 165536);
  EXPECT_EQ(range->count, 65536);
}

TEST(IdMapTest, FindsRangeByNumericId) {
  auto range = FindSubordinateRange("1000:200000:10\n", "runner", 1000);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->first, 200000);
  EXPECT_EQ(range->count, 10);
}

TEST(IdMapTest, FirstValidRangeWins) {
  auto range = FindSubordinateRange(
      "# comment\nrunner:abc:10\nrunner:5:0\n  runner:300000:5  \n"
      "runner:400000:5\n",
      "runner", 1000);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->first, 300000);
}

TEST(IdMapTest, NoRange) {
  EXPECT_FALSE(FindSubordinateRange("", "runner", 1000).has_value());
  EXPECT_FALSE(
      FindSubordinateRange("other:100000:65536\n", "runner", 1000).has_value());
  EXPECT_FALSE(
      FindSubordinateRange("runner:100000\n", "runner", 1000).has_value());
  // A prefix of the name is not the name.
  EXPECT_FALSE(
      FindSubordinateRange("run:100000:10\n", "runner", 1000).has_value());
}

}  // namespace
