#include "model.hpp"
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

using namespace graphkv;

TEST(Model, ParseDirection)
{
  EXPECT_EQ(parseDirection("forward"), Direction::Forward);
  EXPECT_EQ(parseDirection("out"), Direction::Forward);
  EXPECT_EQ(parseDirection("backward"), Direction::Backward);
  EXPECT_EQ(parseDirection("in"), Direction::Backward);
  EXPECT_EQ(parseDirection("any"), Direction::Any);
  EXPECT_EQ(parseDirection("both"), Direction::Any);
  EXPECT_FALSE(parseDirection("sideways").has_value());
  EXPECT_STREQ(directionName(Direction::Backward), "backward");
}

TEST(Model, RandomUuidShape)
{
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i)
  {
    std::string id = randomUuid();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_EQ(id[18], '-');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
    EXPECT_EQ(id[23], '-');
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 100u);
}

TEST(Model, SortedIdSets)
{
  std::vector<std::string> ids{"c", "a", "c", "b"};
  sortUnique(ids);
  EXPECT_EQ(ids, (std::vector<std::string>{"a", "b", "c"}));

  EXPECT_FALSE(insertSorted(ids, "b"));
  EXPECT_TRUE(insertSorted(ids, "bb"));
  EXPECT_EQ(ids, (std::vector<std::string>{"a", "b", "bb", "c"}));

  EXPECT_TRUE(eraseSorted(ids, "a"));
  EXPECT_FALSE(eraseSorted(ids, "a"));

  EXPECT_EQ(unionSorted({"a", "c"}, {"b", "c"}), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Model, SelfLoop)
{
  EXPECT_TRUE((Edge{"e", "a", "a", {}}).isSelfLoop());
  EXPECT_FALSE((Edge{"e", "a", "b", {}}).isSelfLoop());
}
