#include "lmdb_backend.hpp"
#include "encode.hpp"
#include "env.hpp"
#include <gtest/gtest.h>
#include <kj/debug.h>
#include <lmdb.h>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

using namespace graphkv;

namespace
{

  std::string uniqueTempPath(const std::string &stem)
  {
    auto base = std::filesystem::temp_directory_path() / (stem + std::to_string(::getpid()) + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    return base.string();
  }

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

class LmdbBackendTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    dataDir = uniqueTempPath("graphkv-lmdb-test-");
  }

  void TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove_all(dataDir, ec);
  }

  std::unique_ptr<LmdbBackend> open(bool internKeys = false)
  {
    LmdbOptions options;
    options.path = dataDir;
    options.mapSizeBytes = size_t(64) << 20;
    options.internKeys = internKeys;
    return std::make_unique<LmdbBackend>(options);
  }

  std::string dataDir;
};

TEST_F(LmdbBackendTest, PutGetRemove)
{
  auto b = open();
  EXPECT_FALSE(b->get(Partition::Nodes, "a").has_value());

  b->put(Partition::Nodes, "a", "payload");
  ASSERT_TRUE(b->get(Partition::Nodes, "a").has_value());
  EXPECT_EQ(*b->get(Partition::Nodes, "a"), "payload");
  EXPECT_FALSE(b->get(Partition::Edges, "a").has_value());

  b->remove(Partition::Nodes, "a");
  EXPECT_NO_THROW(b->remove(Partition::Nodes, "a"));
  EXPECT_FALSE(b->get(Partition::Nodes, "a").has_value());
}

TEST_F(LmdbBackendTest, PersistsAcrossReopen)
{
  {
    auto b = open();
    b->multiPut(Partition::Edges, {{"e1", "one"}, {"e2", "two"}});
    b->close();
  }
  auto b = open();
  auto got = b->multiGet(Partition::Edges, {"e1", "e2", "e3"});
  EXPECT_EQ(got.size(), 2u);
  EXPECT_EQ(got.at("e1"), "one");
  EXPECT_EQ(got.at("e2"), "two");
}

TEST_F(LmdbBackendTest, RangeIsHalfOpen)
{
  auto b = open();
  for (const char *k : {"n1", "n2", "n3", "n4"})
    b->put(Partition::Nodes, k, "v");

  EXPECT_EQ(collectKeys(*b, Partition::Nodes, "n2", "n4"), (std::vector<std::string>{"n2", "n3"}));
  EXPECT_EQ(collectKeys(*b, Partition::Nodes, "", ""), (std::vector<std::string>{"n1", "n2", "n3", "n4"}));
  EXPECT_TRUE(collectKeys(*b, Partition::Nodes, "z", "").empty());
}

TEST_F(LmdbBackendTest, UnstorableKeysReadAsAbsent)
{
  auto b = open();
  const std::string tooLong(600, 'k');

  EXPECT_FALSE(b->get(Partition::Edges, "").has_value());
  EXPECT_FALSE(b->get(Partition::Edges, tooLong).has_value());
  EXPECT_NO_THROW(b->remove(Partition::Edges, ""));
  EXPECT_NO_THROW(b->remove(Partition::Edges, tooLong));

  b->put(Partition::Edges, "e", "v");
  auto got = b->multiGet(Partition::Edges, {"", "e", tooLong});
  EXPECT_EQ(got.size(), 1u);
  EXPECT_EQ(got.at("e"), "v");

  EXPECT_THROW(b->put(Partition::Edges, "", "v"), MdbError);
  EXPECT_THROW(b->put(Partition::Edges, tooLong, "v"), MdbError);
  EXPECT_THROW(b->multiPut(Partition::Edges, {{"", "v"}}), MdbError);
}

TEST_F(LmdbBackendTest, RangeCallbackMayReadAndWrite)
{
  auto b = open();
  KeyValueMap entries;
  for (int i = 0; i < 600; ++i)
  {
    char key[16];
    std::snprintf(key, sizeof(key), "k%04d", i);
    entries.emplace(key, key);
  }
  b->multiPut(Partition::Nodes, entries);

  size_t visited = 0;
  std::string last;
  b->rangeIterate(Partition::Nodes, "k0010", "k0590", [&](std::string_view k, std::string_view v)
                  {
    EXPECT_EQ(k, v);
    EXPECT_GT(std::string(k), last);
    last = std::string(k);
    EXPECT_TRUE(b->get(Partition::Nodes, k).has_value());
    b->put(Partition::Adjacency, k, "seen");
    ++visited;
    return true; });

  EXPECT_EQ(visited, 580u);
  EXPECT_EQ(last, "k0589");
  EXPECT_EQ(collectKeys(*b, Partition::Adjacency, "", "").size(), 580u);
}

TEST_F(LmdbBackendTest, RangeStopsAcrossBatches)
{
  auto b = open();
  KeyValueMap entries;
  for (int i = 0; i < 600; ++i)
  {
    char key[16];
    std::snprintf(key, sizeof(key), "k%04d", i);
    entries.emplace(key, "v");
  }
  b->multiPut(Partition::Nodes, entries);

  size_t visited = 0;
  b->rangeIterate(Partition::Nodes, "", "", [&](std::string_view, std::string_view)
                  { return ++visited < 300; });
  EXPECT_EQ(visited, 300u);
}

TEST_F(LmdbBackendTest, InternedRangeCallbackMayRead)
{
  auto b = open(true);
  for (int i = 0; i < 600; ++i)
    b->put(Partition::Edges, "e" + std::to_string(i), std::to_string(i));

  size_t visited = 0;
  b->rangeIterate(Partition::Edges, "", "", [&](std::string_view k, std::string_view v)
                  {
    auto got = b->get(Partition::Edges, k);
    EXPECT_TRUE(got.has_value() && *got == v);
    EXPECT_EQ("e" + std::string(v), std::string(k));
    ++visited;
    return true; });
  EXPECT_EQ(visited, 600u);
  EXPECT_FALSE(b->get(Partition::Edges, "").has_value());
  EXPECT_FALSE(b->internedKey("").has_value());
}

TEST_F(LmdbBackendTest, InterningAllocatesOnWriteOnly)
{
  auto b = open(true);
  EXPECT_TRUE(b->internsKeys());

  EXPECT_FALSE(b->get(Partition::Nodes, "ghost").has_value());
  EXPECT_FALSE(b->internedKey("ghost").has_value());

  b->put(Partition::Nodes, "zeta", "z");
  b->put(Partition::Edges, "alpha", "a");
  b->put(Partition::Adjacency, "zeta", "adj");

  ASSERT_TRUE(b->internedKey("zeta").has_value());
  ASSERT_TRUE(b->internedKey("alpha").has_value());
  EXPECT_EQ(*b->internedKey("zeta"), 1u);
  EXPECT_EQ(*b->internedKey("alpha"), 2u);

  EXPECT_EQ(*b->get(Partition::Nodes, "zeta"), "z");
  EXPECT_EQ(*b->get(Partition::Adjacency, "zeta"), "adj");
  EXPECT_EQ(*b->get(Partition::Edges, "alpha"), "a");
}

TEST_F(LmdbBackendTest, InternedRangeReturnsOriginalKeys)
{
  auto b = open(true);
  for (const char *k : {"c", "a", "b"})
    b->put(Partition::Nodes, k, "v");

  // allocation order, filtered on the id bounds
  EXPECT_EQ(collectKeys(*b, Partition::Nodes, "", ""), (std::vector<std::string>{"c", "a", "b"}));
  EXPECT_EQ(collectKeys(*b, Partition::Nodes, "b", ""), (std::vector<std::string>{"c", "b"}));
  EXPECT_EQ(collectKeys(*b, Partition::Nodes, "a", "c"), (std::vector<std::string>{"a", "b"}));
}

TEST_F(LmdbBackendTest, InternedKeysSurviveReopen)
{
  {
    auto b = open(true);
    b->put(Partition::Nodes, "n", "v");
  }
  auto b = open(true);
  EXPECT_EQ(*b->get(Partition::Nodes, "n"), "v");
  b->put(Partition::Nodes, "m", "w");
  EXPECT_EQ(*b->internedKey("m"), 2u);
}

TEST_F(LmdbBackendTest, KeyModeMismatchThrows)
{
  {
    auto b = open(false);
    b->put(Partition::Nodes, "a", "v");
  }
  EXPECT_THROW(open(true), MdbError);
  EXPECT_NO_THROW(open(false));
}

TEST_F(LmdbBackendTest, UnknownSchemaVersionThrows)
{
  open()->close();
  {
    Env env(dataDir, size_t(64) << 20);
    Txn tx(env.raw(), true);
    std::string key = key_meta_schema_version();
    std::string value;
    put_be32(value, 2);
    MDB_val k{key.size(), key.data()};
    MDB_val v{value.size(), value.data()};
    ASSERT_EQ(mdb_put(tx.get(), env.meta(), &k, &v, 0), 0);
    tx.commit();
  }
  EXPECT_THROW(open(), MdbError);
}

TEST_F(LmdbBackendTest, CallsAfterCloseThrow)
{
  auto b = open();
  b->close();
  EXPECT_NO_THROW(b->close());
  EXPECT_THROW(b->get(Partition::Nodes, "a"), BackendError);
  EXPECT_THROW(b->put(Partition::Nodes, "a", "v"), BackendError);
}
