#include "upkeep/cache/memory_cache.hpp"

#include "test_utils.hpp"

#include <stdexcept>

#include "gtest/gtest.h"

using namespace upkeep;
using namespace upkeep::test;
using namespace std::chrono_literals;

class MemoryCacheTest : public ::testing::Test {
protected:
  ManualClock clock_;
  MemoryCache cache_{MemoryCache::kDefaultMaxItems, clock_};
};

TEST_F(MemoryCacheTest, MissingKeyIsAbsent) {
  EXPECT_FALSE(cache_.get("missing").has_value());
  EXPECT_FALSE(cache_.has("missing"));
}

TEST_F(MemoryCacheTest, StoredFalseIsAHit) {
  cache_.set("flag", false);

  auto v = cache_.get("flag");
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, false);
  EXPECT_TRUE(cache_.has("flag"));
}

TEST_F(MemoryCacheTest, StoredNullIsAHit) {
  cache_.set("nothing", nullptr);

  auto v = cache_.get("nothing");
  ASSERT_TRUE(v.has_value());
  EXPECT_TRUE(v->is_null());
}

TEST_F(MemoryCacheTest, GetOrReturnsFallbackOnlyWhenAbsent) {
  cache_.set("zero", 0);

  EXPECT_EQ(cache_.get_or("zero", 42), 0);
  EXPECT_EQ(cache_.get_or("missing", 42), 42);
}

TEST_F(MemoryCacheTest, TtlBoundary) {
  cache_.set("k", "v", 60s);

  clock_.advance(59s);
  EXPECT_TRUE(cache_.has("k"));

  clock_.advance(1s);
  EXPECT_FALSE(cache_.has("k"));
  EXPECT_FALSE(cache_.get("k").has_value());
}

TEST_F(MemoryCacheTest, ZeroTtlNeverExpires) {
  cache_.set("k", "v");
  clock_.advance(24h * 365);
  EXPECT_TRUE(cache_.has("k"));
}

TEST_F(MemoryCacheTest, RemoveReportsExistence) {
  cache_.set("k", 1);
  EXPECT_TRUE(cache_.remove("k"));
  EXPECT_FALSE(cache_.remove("k"));
}

TEST_F(MemoryCacheTest, ClearByPrefix) {
  cache_.set("user_1", 1);
  cache_.set("user_2", 2);
  cache_.set("post_1", 3);

  EXPECT_TRUE(cache_.clear("user_"));
  EXPECT_FALSE(cache_.has("user_1"));
  EXPECT_TRUE(cache_.has("post_1"));

  EXPECT_TRUE(cache_.clear());
  EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(MemoryCacheTest, IncrementCreatesMissingKey) {
  EXPECT_EQ(cache_.increment("hits").value(), 1);
  EXPECT_EQ(cache_.increment("hits", 4).value(), 5);
}

TEST_F(MemoryCacheTest, IncrementNumericString) {
  cache_.set("n", "10");
  EXPECT_EQ(cache_.increment("n").value(), 11);
}

TEST_F(MemoryCacheTest, IncrementNonNumericFails) {
  cache_.set("name", "abc");

  auto r = cache_.increment("name");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotNumeric));
  EXPECT_EQ(cache_.get("name").value(), "abc");
}

TEST_F(MemoryCacheTest, DecrementFloorsAtZero) {
  cache_.set("n", 3);

  EXPECT_EQ(cache_.decrement("n", 2).value(), 1);
  EXPECT_EQ(cache_.decrement("n", 5).value(), 0);
  EXPECT_EQ(cache_.decrement("missing").value(), 0);
}

TEST_F(MemoryCacheTest, RememberComputesOnce) {
  int calls = 0;
  auto producer = [&] {
    ++calls;
    return CacheValue("computed");
  };

  EXPECT_EQ(cache_.remember("k", producer), "computed");
  EXPECT_EQ(cache_.remember("k", producer), "computed");
  EXPECT_EQ(calls, 1);
}

TEST_F(MemoryCacheTest, RememberPropagatesAndStoresNothing) {
  EXPECT_THROW(cache_.remember("k",
                               []() -> CacheValue {
                                 throw std::runtime_error("boom");
                               }),
               std::runtime_error);
  EXPECT_FALSE(cache_.has("k"));
}

TEST_F(MemoryCacheTest, MultipleOperations) {
  EXPECT_TRUE(cache_.set_multiple({{"a", 1}, {"b", 2}}));

  auto got = cache_.get_multiple({"a", "b", "c"}, "none");
  EXPECT_EQ(got["a"], 1);
  EXPECT_EQ(got["b"], 2);
  EXPECT_EQ(got["c"], "none");

  EXPECT_FALSE(cache_.delete_multiple({"a", "c"}));
  EXPECT_FALSE(cache_.has("a"));
  EXPECT_TRUE(cache_.has("b"));
}

TEST_F(MemoryCacheTest, EvictsLeastRecentlyUsed) {
  MemoryCache small(2, clock_);
  small.set("a", 1);
  small.set("b", 2);
  ASSERT_TRUE(small.get("a").has_value());

  small.set("c", 3);

  EXPECT_TRUE(small.has("a"));
  EXPECT_FALSE(small.has("b"));
  EXPECT_TRUE(small.has("c"));
  EXPECT_EQ(small.stats().evictions, 1u);
}

TEST_F(MemoryCacheTest, ExpiredEntriesAreDroppedBeforeEvicting) {
  MemoryCache small(2, clock_);
  small.set("short", 1, 10s);
  small.set("long", 2);
  clock_.advance(10s);

  small.set("new", 3);

  EXPECT_TRUE(small.has("long"));
  EXPECT_TRUE(small.has("new"));
  EXPECT_EQ(small.stats().evictions, 0u);
}

TEST_F(MemoryCacheTest, ZeroMaxItemsIsUnbounded) {
  MemoryCache unbounded(0, clock_);
  for (int i = 0; i < 5000; ++i) {
    unbounded.set(std::to_string(i), i);
  }
  EXPECT_EQ(unbounded.size(), 5000u);
}

TEST_F(MemoryCacheTest, SetMaxItemsShrinks) {
  cache_.set("a", 1);
  cache_.set("b", 2);
  cache_.set("c", 3);

  cache_.set_max_items(1);

  EXPECT_EQ(cache_.size(), 1u);
  EXPECT_TRUE(cache_.has("c"));
  EXPECT_EQ(cache_.max_items(), 1u);
}

TEST_F(MemoryCacheTest, StatsCountHitsAndMisses) {
  cache_.set("k", 1);
  (void)cache_.get("k");
  (void)cache_.get("missing");
  cache_.remove("k");

  auto stats = cache_.stats();
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_EQ(stats.misses, 1u);
  EXPECT_EQ(stats.writes, 1u);
  EXPECT_EQ(stats.deletes, 1u);

  cache_.reset_stats();
  EXPECT_EQ(cache_.stats().hits, 0u);
}

TEST_F(MemoryCacheTest, GcAndFlush) {
  cache_.set("short", 1, 5s);
  cache_.set("long", 2);
  clock_.advance(5s);

  EXPECT_EQ(cache_.gc(), 1u);
  EXPECT_EQ(cache_.keys(), std::vector<std::string>{"long"});

  cache_.flush();
  EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(MemoryCacheTest, BackendType) {
  EXPECT_EQ(cache_.backend(), CacheBackend::Memory);
  EXPECT_FALSE(cache_.supports_atomic_increment());
}

TEST(NumericValueTest, Conversions) {
  EXPECT_EQ(numeric_value(5), 5);
  EXPECT_EQ(numeric_value(2.9), 2);
  EXPECT_EQ(numeric_value("17"), 17);
  EXPECT_EQ(numeric_value("1.5"), 1);
  EXPECT_FALSE(numeric_value("abc").has_value());
  EXPECT_FALSE(numeric_value("").has_value());
  EXPECT_FALSE(numeric_value(true).has_value());
  EXPECT_FALSE(numeric_value(nullptr).has_value());
  EXPECT_FALSE(numeric_value(nlohmann::json::array()).has_value());
}
