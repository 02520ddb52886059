// =============================================================================
// enumerable_set_test.cpp
// =============================================================================
// Unit tests for escrow::EnumerableSet<T>: O(1) membership plus a compact,
// enumerable value array maintained by swap-and-pop.
// =============================================================================

#include "escrow/containers/enumerable_set.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using escrow::EnumerableSet;

TEST(EnumerableSetTest, InsertIsIdempotent) {
  EnumerableSet<std::string> set;

  EXPECT_TRUE(set.insert("ALPHA"));
  EXPECT_FALSE(set.insert("ALPHA"));

  EXPECT_EQ(set.size(), 1u);
  EXPECT_TRUE(set.contains("ALPHA"));
}

TEST(EnumerableSetTest, EraseAbsentIsNoop) {
  EnumerableSet<std::string> set;
  set.insert("ALPHA");

  EXPECT_FALSE(set.erase("BETA"));
  EXPECT_EQ(set.size(), 1u);
}

// -----------------------------------------------------------------------------
// Removing from the middle moves the last value into the hole; the moved
// value must stay reachable through contains() and erase().
// -----------------------------------------------------------------------------
TEST(EnumerableSetTest, SwapAndPopKeepsIndexConsistent) {
  EnumerableSet<std::string> set;
  set.insert("A");
  set.insert("B");
  set.insert("C");
  set.insert("D");

  ASSERT_TRUE(set.erase("B"));

  EXPECT_EQ(set.values(), (std::vector<std::string>{"A", "D", "C"}));
  EXPECT_TRUE(set.contains("D"));
  EXPECT_FALSE(set.contains("B"));

  ASSERT_TRUE(set.erase("D"));
  EXPECT_EQ(set.values(), (std::vector<std::string>{"A", "C"}));
  EXPECT_EQ(set.back(), "C");
}

TEST(EnumerableSetTest, EraseLastAndOnlyElement) {
  EnumerableSet<int> set;
  set.insert(1);
  set.insert(2);

  EXPECT_TRUE(set.erase(2));
  EXPECT_EQ(set.back(), 1);
  EXPECT_TRUE(set.erase(1));
  EXPECT_TRUE(set.empty());

  // Re-insert after the set went empty.
  EXPECT_TRUE(set.insert(2));
  EXPECT_EQ(set.values()[0], 2);
}

TEST(EnumerableSetTest, ValuesMatchMembershipAfterChurn) {
  EnumerableSet<int> set;
  for (int i = 0; i < 100; ++i) {
    set.insert(i);
  }
  for (int i = 0; i < 100; i += 3) {
    set.erase(i);
  }

  for (int i = 0; i < 100; ++i) {
    const bool listed = std::find(set.values().begin(), set.values().end(),
                                  i) != set.values().end();
    EXPECT_EQ(listed, set.contains(i)) << "value " << i;
    EXPECT_EQ(set.contains(i), i % 3 != 0) << "value " << i;
  }
}
