#include "logwire/string-table.hpp"

#include <gtest/gtest.h>

#include <string>

namespace logwire {

TEST(StringTableTest, InsertionOrderAndDeduplication) {
  StringTable table;
  EXPECT_TRUE(table.empty());
  EXPECT_EQ(table.intern("D1"), 0U);
  EXPECT_EQ(table.intern("S1"), 1U);
  EXPECT_EQ(table.intern("D1"), 0U);
  EXPECT_EQ(table.intern(""), 2U);
  EXPECT_EQ(table.size(), 3U);
  EXPECT_EQ(table[1], "S1");
  EXPECT_EQ(table.strings()[2], "");
}

TEST(StringTableTest, Find) {
  StringTable table;
  table.intern("alpha");
  table.intern(std::string(100, 'x'));
  EXPECT_EQ(table.find("alpha"), 0);
  EXPECT_EQ(table.find(std::string(100, 'x')), 1);
  EXPECT_EQ(table.find("beta"), -1);
}

TEST(StringTableTest, ClearResetsIndexes) {
  StringTable table;
  table.intern("a");
  table.intern("b");
  table.clear();
  EXPECT_TRUE(table.empty());
  EXPECT_EQ(table.find("a"), -1);
  EXPECT_EQ(table.intern("b"), 0U);
}

}  // namespace logwire
