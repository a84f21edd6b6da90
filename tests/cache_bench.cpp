#include "upkeep/cache/memory_cache.hpp"
#include "upkeep/cache/transient_cache.hpp"
#include "upkeep/ratelimit/rate_limiter.hpp"
#include "upkeep/storage/sqlite_store.hpp"

#include <benchmark/benchmark.h>

#include <filesystem>

#include <unistd.h>

using namespace upkeep;

static void BM_MemoryCacheSetGet(benchmark::State& state) {
  MemoryCache cache(static_cast<std::size_t>(state.range(0)));
  std::int64_t i = 0;
  for (auto _ : state) {
    auto key = "key_" + std::to_string(i++ % state.range(0));
    cache.set(key, i);
    auto value = cache.get(key);
    benchmark::DoNotOptimize(value);
  }
}
BENCHMARK(BM_MemoryCacheSetGet)->Arg(100)->Arg(10000);

static void BM_MemoryCacheEviction(benchmark::State& state) {
  MemoryCache cache(256);
  std::int64_t i = 0;
  for (auto _ : state) {
    cache.set("key_" + std::to_string(i++), i);
  }
  state.counters["evictions"] =
      static_cast<double>(cache.stats().evictions);
}
BENCHMARK(BM_MemoryCacheEviction);

class StoreBenchFixture : public benchmark::Fixture {
public:
  void SetUp(const ::benchmark::State& state) override {
    (void)state;
    std::string pattern = "/tmp/upkeep_bench_XXXXXX";
    int fd = ::mkstemp(pattern.data());
    if (fd >= 0) {
      ::close(fd);
    }
    db_path_ = pattern;
    store_ = std::make_unique<SqliteStore>(db_path_);
    auto opened = store_->open();
    benchmark::DoNotOptimize(opened);
  }

  void TearDown(const ::benchmark::State& state) override {
    (void)state;
    store_->close();
    store_.reset();
    std::error_code ec;
    std::filesystem::remove(db_path_, ec);
    std::filesystem::remove(db_path_ + "-wal", ec);
    std::filesystem::remove(db_path_ + "-shm", ec);
  }

  std::string db_path_;
  std::unique_ptr<SqliteStore> store_;
};

BENCHMARK_F(StoreBenchFixture, BM_TransientCacheSetGet)(benchmark::State& state) {
  TransientCache cache(*store_, "bench_");
  std::int64_t i = 0;
  for (auto _ : state) {
    auto key = "key_" + std::to_string(i++ % 100);
    cache.set(key, i, std::chrono::seconds{60});
    auto value = cache.get(key);
    benchmark::DoNotOptimize(value);
  }
}

BENCHMARK_F(StoreBenchFixture, BM_TransientCacheIncrement)(benchmark::State& state) {
  TransientCache cache(*store_, "bench_");
  for (auto _ : state) {
    auto value = cache.increment("counter");
    benchmark::DoNotOptimize(value);
  }
}

BENCHMARK_F(StoreBenchFixture, BM_RateLimiterLockPath)(benchmark::State& state) {
  MemoryCache counters;
  RateLimitConfig config;
  config.requests_per_minute = 1'000'000'000;
  RateLimiter limiter(config, counters, *store_);
  for (auto _ : state) {
    auto r = limiter.check("bench_client");
    benchmark::DoNotOptimize(r);
  }
}
