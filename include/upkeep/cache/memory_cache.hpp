#pragma once

#include "upkeep/cache/cache.hpp"
#include "upkeep/util/clock.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace upkeep {

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t writes{0};
  std::uint64_t deletes{0};
  std::uint64_t evictions{0};
};

// Process-local cache with TTL, LRU eviction and hit/miss accounting.
// Thread-safe; expired entries are dropped lazily on access or by gc().
class MemoryCache final : public Cache {
public:
  static constexpr std::size_t kDefaultMaxItems = 1000;

  // max_items == 0 disables eviction.
  explicit MemoryCache(std::size_t max_items = kDefaultMaxItems,
                       const Clock& clock = system_clock());

  [[nodiscard]] auto get(std::string_view key)
      -> std::optional<CacheValue> override;
  auto set(std::string_view key, const CacheValue& value,
           std::chrono::seconds ttl = std::chrono::seconds{0}) -> bool override;
  auto remove(std::string_view key) -> bool override;
  [[nodiscard]] auto has(std::string_view key) -> bool override;
  auto clear(std::string_view prefix = {}) -> bool override;
  auto increment(std::string_view key, std::int64_t delta = 1)
      -> Result<std::int64_t> override;
  auto decrement(std::string_view key, std::int64_t delta = 1)
      -> Result<std::int64_t> override;

  [[nodiscard]] auto backend() const noexcept -> CacheBackend override {
    return CacheBackend::Memory;
  }

  [[nodiscard]] auto stats() const -> CacheStats;
  auto reset_stats() -> void;
  [[nodiscard]] auto keys() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const -> std::size_t;

  // Drops every expired entry, returns how many were removed.
  auto gc() -> std::size_t;
  // Drops all entries and resets the counters.
  auto flush() -> void;

  [[nodiscard]] auto max_items() const -> std::size_t;
  auto set_max_items(std::size_t max_items) -> void;

private:
  struct Entry {
    CacheValue value;
    TimePoint expires{};  // epoch == never
    std::uint64_t last_access{0};
  };

  using Map = std::unordered_map<std::string, Entry, StringHash, StringEqual>;

  [[nodiscard]] auto is_expired(const Entry& e, TimePoint now) const -> bool;
  // Returns the live entry for key, erasing it first if it has expired.
  auto find_live(std::string_view key, TimePoint now) -> Map::iterator;
  auto evict_lru() -> bool;
  auto gc_locked(TimePoint now) -> std::size_t;
  auto adjust(std::string_view key, std::int64_t delta, bool floor_zero)
      -> Result<std::int64_t>;

  const Clock* clock_;
  mutable std::mutex mu_;
  Map storage_;
  std::size_t max_items_;
  std::uint64_t access_tick_{0};
  CacheStats stats_;
};

}  // namespace upkeep
