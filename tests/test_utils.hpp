#pragma once

#include "upkeep/cache/object_cache_backend.hpp"
#include "upkeep/scheduler/host_scheduler.hpp"
#include "upkeep/storage/sqlite_store.hpp"
#include "upkeep/util/clock.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "gtest/gtest.h"

#include <unistd.h>

namespace upkeep::test {

// Creates a unique /tmp/upkeep_test_XXXXXX.db path and removes it (plus the
// WAL side files) on destruction.
class TempDbPath {
public:
  TempDbPath() {
    std::string pattern = "/tmp/upkeep_test_XXXXXX";
    int fd = ::mkstemp(pattern.data());
    if (fd >= 0) {
      ::close(fd);
      path_ = pattern + ".db";
      std::filesystem::rename(pattern, path_);
      std::filesystem::remove(path_);
    }
  }
  ~TempDbPath() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(path_ + "-wal", ec);
    std::filesystem::remove(path_ + "-shm", ec);
  }

  TempDbPath(const TempDbPath&) = delete;
  auto operator=(const TempDbPath&) -> TempDbPath& = delete;

  [[nodiscard]] auto path() const -> const std::string& {
    return path_;
  }

private:
  std::string path_;
};

// Fixture with an open SqliteStore on a fresh file and a manual clock.
class StoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(db_.path().empty()) << "mkstemp: " << std::strerror(errno);
    store_ = std::make_unique<SqliteStore>(db_.path());
    ASSERT_TRUE(store_->open().has_value());
  }

  void TearDown() override {
    store_->close();
    store_.reset();
  }

  TempDbPath db_;
  std::unique_ptr<SqliteStore> store_;
  ManualClock clock_;
};

// In-memory stand-in for a memcached/redis style host cache.
class FakeObjectCacheBackend : public ObjectCacheBackend {
public:
  bool is_available{true};
  bool group_flush{true};

  [[nodiscard]] auto available() const -> bool override {
    return is_available;
  }

  [[nodiscard]] auto get(std::string_view group, std::string_view key)
      -> std::optional<nlohmann::json> override {
    std::lock_guard lock(mu_);
    auto it = data_.find(full_key(group, key));
    if (it == data_.end()) return std::nullopt;
    return it->second;
  }

  auto set(std::string_view group, std::string_view key,
           const nlohmann::json& value, std::chrono::seconds ttl)
      -> bool override {
    std::lock_guard lock(mu_);
    data_.insert_or_assign(full_key(group, key), value);
    last_ttl = ttl;
    return true;
  }

  auto remove(std::string_view group, std::string_view key) -> bool override {
    std::lock_guard lock(mu_);
    return data_.erase(full_key(group, key)) > 0;
  }

  auto increment(std::string_view group, std::string_view key,
                 std::int64_t delta) -> Result<std::int64_t> override {
    return adjust(group, key, delta);
  }

  auto decrement(std::string_view group, std::string_view key,
                 std::int64_t delta) -> Result<std::int64_t> override {
    return adjust(group, key, -delta);
  }

  [[nodiscard]] auto supports_group_flush() const -> bool override {
    return group_flush;
  }

  auto flush_group(std::string_view group) -> bool override {
    std::lock_guard lock(mu_);
    std::string prefix = std::string{group} + ":";
    std::erase_if(data_, [&](const auto& kv) {
      return kv.first.starts_with(prefix);
    });
    return true;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mu_);
    return data_.size();
  }

  std::chrono::seconds last_ttl{0};

private:
  static auto full_key(std::string_view group, std::string_view key)
      -> std::string {
    return std::string{group} + ":" + std::string{key};
  }

  auto adjust(std::string_view group, std::string_view key,
              std::int64_t delta) -> Result<std::int64_t> {
    std::lock_guard lock(mu_);
    auto it = data_.find(full_key(group, key));
    if (it == data_.end()) return fail(Error::NotFound);
    if (!it->second.is_number_integer()) return fail(Error::NotNumeric);
    auto next = std::max<std::int64_t>(0, it->second.get<std::int64_t>() + delta);
    it->second = next;
    return next;
  }

  mutable std::mutex mu_;
  std::map<std::string, nlohmann::json> data_;
};

// Host scheduler that records calls and can be told to fail.
class FakeHostScheduler : public HostScheduler {
public:
  bool fail_schedule{false};
  bool fail_unschedule{false};
  bool recurring{false};
  int schedule_calls{0};
  int unschedule_calls{0};

  auto schedule(std::string_view task_id, TimePoint at) -> bool override {
    ++schedule_calls;
    if (fail_schedule) return false;
    queue_.insert_or_assign(std::string{task_id}, at);
    return true;
  }

  auto unschedule(std::string_view task_id) -> bool override {
    ++unschedule_calls;
    if (fail_unschedule) return false;
    queue_.erase(std::string{task_id});
    return true;
  }

  [[nodiscard]] auto is_scheduled(std::string_view task_id) -> bool override {
    return queue_.contains(std::string{task_id});
  }

  [[nodiscard]] auto list_scheduled()
      -> std::map<std::string, TimePoint> override {
    return queue_;
  }

  [[nodiscard]] auto supports_recurring() const -> bool override {
    return recurring;
  }

private:
  std::map<std::string, TimePoint> queue_;
};

// 2023-11-14 22:13:20 UTC, the ManualClock default.
inline constexpr std::int64_t kEpochStart = 1'700'000'000;

[[nodiscard]] inline auto at_unix(std::int64_t secs) -> TimePoint {
  return TimePoint{std::chrono::seconds{secs}};
}

}  // namespace upkeep::test
