#include "errors.hpp"
#include "memory_backend.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace graphkv;

namespace
{

  std::vector<std::string> collectKeys(Backend &b, Partition p, std::string_view start, std::string_view end)
  {
    std::vector<std::string> keys;
    b.rangeIterate(p, start, end, [&](std::string_view k, std::string_view)
                   {
      keys.emplace_back(k);
      return true; });
    return keys;
  }

} // namespace

TEST(MemoryBackend, PutGetRemove)
{
  MemoryBackend b;
  EXPECT_FALSE(b.get(Partition::Nodes, "a").has_value());

  b.put(Partition::Nodes, "a", "1");
  b.put(Partition::Nodes, "a", "2");
  ASSERT_TRUE(b.get(Partition::Nodes, "a").has_value());
  EXPECT_EQ(*b.get(Partition::Nodes, "a"), "2");

  // partitions are independent
  EXPECT_FALSE(b.get(Partition::Edges, "a").has_value());

  b.remove(Partition::Nodes, "a");
  b.remove(Partition::Nodes, "missing");
  EXPECT_FALSE(b.get(Partition::Nodes, "a").has_value());
  EXPECT_EQ(b.size(Partition::Nodes), 0u);
}

TEST(MemoryBackend, MultiGetReturnsFoundKeysOnly)
{
  MemoryBackend b;
  b.multiPut(Partition::Edges, {{"x", "1"}, {"y", "2"}});

  auto got = b.multiGet(Partition::Edges, {"x", "nope", "y"});
  EXPECT_EQ(got.size(), 2u);
  EXPECT_EQ(got.at("x"), "1");
  EXPECT_EQ(got.at("y"), "2");
}

TEST(MemoryBackend, RangeIsHalfOpen)
{
  MemoryBackend b;
  for (const char *k : {"a", "b", "c", "d"})
    b.put(Partition::Nodes, k, "v");

  EXPECT_EQ(collectKeys(b, Partition::Nodes, "b", "d"), (std::vector<std::string>{"b", "c"}));
  EXPECT_EQ(collectKeys(b, Partition::Nodes, "", ""), (std::vector<std::string>{"a", "b", "c", "d"}));
  EXPECT_EQ(collectKeys(b, Partition::Nodes, "bb", ""), (std::vector<std::string>{"c", "d"}));

  int seen = 0;
  b.rangeIterate(Partition::Nodes, "", "", [&](std::string_view, std::string_view)
                 { return ++seen < 2; });
  EXPECT_EQ(seen, 2);
}

TEST(MemoryBackend, CountsCallsPerPartition)
{
  MemoryBackend b;
  b.put(Partition::Adjacency, "n", "v");
  b.get(Partition::Adjacency, "n");
  b.multiPut(Partition::Adjacency, {{"m", "v"}});
  b.multiGet(Partition::Nodes, {"n"});

  auto adj = b.stats(Partition::Adjacency);
  EXPECT_EQ(adj.puts, 1u);
  EXPECT_EQ(adj.gets, 1u);
  EXPECT_EQ(adj.multiPuts, 1u);
  EXPECT_EQ(adj.multiGets, 0u);
  EXPECT_EQ(b.stats(Partition::Nodes).multiGets, 1u);

  b.resetStats();
  EXPECT_EQ(b.stats(Partition::Adjacency).puts, 0u);
}

TEST(MemoryBackend, PartitionNames)
{
  EXPECT_STREQ(partitionName(Partition::Nodes), "nodes");
  EXPECT_STREQ(partitionName(Partition::Edges), "edges");
  EXPECT_STREQ(partitionName(Partition::Adjacency), "adjacency");
}

TEST(MemoryBackend, CallsAfterCloseThrow)
{
  MemoryBackend b;
  b.put(Partition::Nodes, "a", "1");
  b.close();
  EXPECT_TRUE(b.closed());
  EXPECT_NO_THROW(b.close());
  EXPECT_THROW(b.get(Partition::Nodes, "a"), BackendError);
  EXPECT_THROW(b.put(Partition::Nodes, "a", "1"), BackendError);
  EXPECT_THROW(b.multiGet(Partition::Nodes, {"a"}), BackendError);
}
