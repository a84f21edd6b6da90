#include "upkeep/ratelimit/rate_limiter.hpp"

#include "upkeep/cache/memory_cache.hpp"
#include "upkeep/cache/null_cache.hpp"
#include "upkeep/cache/object_cache.hpp"
#include "upkeep/cache/transient_cache.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace upkeep;
using namespace upkeep::test;
using namespace std::chrono_literals;

namespace {

auto small_config(int limit) -> RateLimitConfig {
  RateLimitConfig config;
  config.requests_per_minute = limit;
  config.lock_attempts = 3;
  config.lock_backoff = 1ms;
  return config;
}

auto lock_rows(std::string_view caller) -> std::pair<std::string, std::string> {
  auto stored = TransientCache::build_key("upkeep_", "rl_lock_" + std::string{caller});
  return {TransientCache::timeout_row(stored), TransientCache::value_row(stored)};
}

}  // namespace

class AtomicRateLimiterTest : public StoreTest {
protected:
  FakeObjectCacheBackend backend_;
  ObjectCache cache_{backend_};
};

TEST_F(AtomicRateLimiterTest, RejectsRequestAfterLimit) {
  RateLimiter limiter(small_config(3), cache_, *store_, clock_);

  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(limiter.check("alice").has_value()) << "request " << i;
  }
  auto r = limiter.check("alice");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::RateLimitExceeded));
}

TEST_F(AtomicRateLimiterTest, CallersAreCountedSeparately) {
  RateLimiter limiter(small_config(1), cache_, *store_, clock_);

  EXPECT_TRUE(limiter.check("alice").has_value());
  EXPECT_FALSE(limiter.check("alice").has_value());
  EXPECT_TRUE(limiter.check("bob").has_value());
}

TEST_F(AtomicRateLimiterTest, FirstRequestStartsWindow) {
  RateLimiter limiter(small_config(5), cache_, *store_, clock_);

  ASSERT_TRUE(limiter.check("alice").has_value());

  EXPECT_EQ(cache_.get(RateLimiter::counter_key("alice")).value(), 1);
  EXPECT_EQ(backend_.last_ttl, RateLimiter::kWindow);
}

TEST_F(AtomicRateLimiterTest, NeverTakesStoreLock) {
  RateLimiter limiter(small_config(5), cache_, *store_, clock_);
  ASSERT_TRUE(limiter.check("alice").has_value());

  EXPECT_EQ(store_->count_prefix("_transient_").value(), 0u);
}

TEST_F(AtomicRateLimiterTest, EmptyCallerAndDisabledLimitAlwaysPass) {
  RateLimiter disabled(small_config(0), cache_, *store_, clock_);
  RateLimiter limiter(small_config(1), cache_, *store_, clock_);

  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(disabled.check("alice").has_value());
    EXPECT_TRUE(limiter.check("").has_value());
  }
}

class LockingRateLimiterTest : public StoreTest {
protected:
  void SetUp() override {
    StoreTest::SetUp();
    cache_ = std::make_unique<TransientCache>(*store_, "upkeep_", clock_);
  }

  void TearDown() override {
    cache_.reset();
    StoreTest::TearDown();
  }

  std::unique_ptr<TransientCache> cache_;
};

TEST_F(LockingRateLimiterTest, RejectsRequestAfterLimit) {
  RateLimiter limiter(small_config(3), *cache_, *store_, clock_);

  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(limiter.check("alice").has_value()) << "request " << i;
  }
  auto r = limiter.check("alice");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::RateLimitExceeded));
  EXPECT_TRUE(limiter.check("bob").has_value());
}

TEST_F(LockingRateLimiterTest, LockIsReleasedAfterCheck) {
  RateLimiter limiter(small_config(3), *cache_, *store_, clock_);
  ASSERT_TRUE(limiter.check("alice").has_value());

  auto [timeout_row, value_row] = lock_rows("alice");
  EXPECT_FALSE(store_->get(timeout_row)->has_value());
  EXPECT_FALSE(store_->get(value_row)->has_value());
}

TEST_F(LockingRateLimiterTest, HeldLockFailsClosed) {
  RateLimiter limiter(small_config(3), *cache_, *store_, clock_);
  auto [timeout_row, value_row] = lock_rows("alice");
  auto held_until = std::to_string(kEpochStart + 5);
  ASSERT_EQ(store_->insert_pair_if_absent(timeout_row, held_until, value_row,
                                          TransientCache::wrap(1))
                .value(),
            2);

  auto r = limiter.check("alice");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::RateLimiterUnavailable));

  EXPECT_FALSE(cache_->has(RateLimiter::counter_key("alice")));
  EXPECT_EQ(store_->get(timeout_row)->value_or(""), held_until);
}

TEST_F(LockingRateLimiterTest, ExpiredLockIsTakenOver) {
  RateLimiter limiter(small_config(3), *cache_, *store_, clock_);
  auto [timeout_row, value_row] = lock_rows("alice");
  ASSERT_TRUE(store_->put(timeout_row, std::to_string(kEpochStart - 10))
                  .has_value());
  ASSERT_TRUE(store_->put(value_row, TransientCache::wrap(1)).has_value());

  EXPECT_TRUE(limiter.check("alice").has_value());
  EXPECT_FALSE(store_->get(timeout_row)->has_value());
}

TEST_F(LockingRateLimiterTest, OrphanedLockRowIsTakenOver) {
  RateLimiter limiter(small_config(3), *cache_, *store_, clock_);
  auto [timeout_row, value_row] = lock_rows("alice");
  ASSERT_TRUE(store_->put(value_row, TransientCache::wrap(1)).has_value());

  EXPECT_TRUE(limiter.check("alice").has_value());
}

TEST_F(LockingRateLimiterTest, UnreadableExpiryIsTakenOver) {
  RateLimiter limiter(small_config(3), *cache_, *store_, clock_);
  auto [timeout_row, value_row] = lock_rows("alice");
  ASSERT_EQ(store_->insert_pair_if_absent(timeout_row, "garbage", value_row,
                                          TransientCache::wrap(1))
                .value(),
            2);

  EXPECT_TRUE(limiter.check("alice").has_value());
}

TEST_F(LockingRateLimiterTest, WindowExpires) {
  RateLimiter limiter(small_config(1), *cache_, *store_, clock_);
  ASSERT_TRUE(limiter.check("alice").has_value());
  ASSERT_FALSE(limiter.check("alice").has_value());

  clock_.advance(RateLimiter::kWindow);

  EXPECT_TRUE(limiter.check("alice").has_value());
}

TEST_F(LockingRateLimiterTest, NonNumericCounterRestartsCount) {
  RateLimiter limiter(small_config(2), *cache_, *store_, clock_);
  ASSERT_TRUE(cache_->set(RateLimiter::counter_key("alice"), "junk"));

  EXPECT_TRUE(limiter.check("alice").has_value());
  EXPECT_EQ(cache_->get(RateLimiter::counter_key("alice")).value(), 1);
}

TEST_F(LockingRateLimiterTest, NullCacheStillEnforcesLimit) {
  NullCache none;
  RateLimiter limiter(small_config(1), none, *store_, clock_);

  ASSERT_TRUE(limiter.check("alice").has_value());
  auto r = limiter.check("alice");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::RateLimitExceeded));
  EXPECT_EQ(cache_->get(RateLimiter::counter_key("alice")).value(), 1);
}

TEST_F(LockingRateLimiterTest, LimitersSharingStoreShareCount) {
  MemoryCache first_cache(MemoryCache::kDefaultMaxItems, clock_);
  MemoryCache second_cache(MemoryCache::kDefaultMaxItems, clock_);
  RateLimiter first(small_config(2), first_cache, *store_, clock_);
  RateLimiter second(small_config(2), second_cache, *store_, clock_);

  EXPECT_TRUE(first.check("alice").has_value());
  EXPECT_TRUE(second.check("alice").has_value());
  EXPECT_FALSE(first.check("alice").has_value());
  EXPECT_FALSE(second.check("alice").has_value());
  EXPECT_FALSE(first_cache.has(RateLimiter::counter_key("alice")));
}

TEST_F(LockingRateLimiterTest, ConcurrentCallersNeverExceedLimit) {
  constexpr int kLimit = 10;
  constexpr int kThreads = 4;
  constexpr int kPerThread = 8;

  MemoryCache memory(MemoryCache::kDefaultMaxItems, clock_);
  auto config = small_config(kLimit);
  config.lock_attempts = 50;
  RateLimiter limiter(config, memory, *store_, clock_);

  std::atomic<int> allowed{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        auto r = limiter.check("shared");
        if (r) {
          allowed.fetch_add(1);
        } else if (r.error() == make_error_code(Error::RateLimitExceeded)) {
          rejected.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_LE(allowed.load(), kLimit);
  EXPECT_GT(rejected.load(), 0);
  EXPECT_LE(cache_->get(RateLimiter::counter_key("shared")).value(), kLimit);
}
