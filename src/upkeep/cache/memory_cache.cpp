#include "upkeep/cache/memory_cache.hpp"

#include <algorithm>

namespace upkeep {

MemoryCache::MemoryCache(std::size_t max_items, const Clock& clock)
    : clock_(&clock), max_items_(max_items) {
}

auto MemoryCache::is_expired(const Entry& e, TimePoint now) const -> bool {
  if (e.expires == TimePoint{}) {
    return false;
  }
  return now >= e.expires;
}

auto MemoryCache::find_live(std::string_view key, TimePoint now)
    -> Map::iterator {
  auto it = storage_.find(key);
  if (it != storage_.end() && is_expired(it->second, now)) {
    storage_.erase(it);
    return storage_.end();
  }
  return it;
}

auto MemoryCache::get(std::string_view key) -> std::optional<CacheValue> {
  std::lock_guard lock(mu_);
  auto it = find_live(key, clock_->now());
  if (it == storage_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  ++stats_.hits;
  it->second.last_access = ++access_tick_;
  return it->second.value;
}

auto MemoryCache::set(std::string_view key, const CacheValue& value,
                      std::chrono::seconds ttl) -> bool {
  std::lock_guard lock(mu_);
  auto now = clock_->now();
  Entry entry{value, ttl.count() > 0 ? now + ttl : TimePoint{}, ++access_tick_};

  if (auto it = storage_.find(key); it != storage_.end()) {
    it->second = std::move(entry);
    ++stats_.writes;
    return true;
  }

  if (max_items_ > 0 && storage_.size() >= max_items_) {
    gc_locked(now);
    while (storage_.size() >= max_items_ && evict_lru()) {
    }
  }

  storage_.emplace(std::string(key), std::move(entry));
  ++stats_.writes;
  return true;
}

auto MemoryCache::remove(std::string_view key) -> bool {
  std::lock_guard lock(mu_);
  auto it = storage_.find(key);
  if (it == storage_.end()) {
    return false;
  }
  storage_.erase(it);
  ++stats_.deletes;
  return true;
}

auto MemoryCache::has(std::string_view key) -> bool {
  std::lock_guard lock(mu_);
  return find_live(key, clock_->now()) != storage_.end();
}

auto MemoryCache::clear(std::string_view prefix) -> bool {
  std::lock_guard lock(mu_);
  if (prefix.empty()) {
    storage_.clear();
    return true;
  }
  std::erase_if(storage_, [prefix](const auto& kv) {
    return std::string_view(kv.first).starts_with(prefix);
  });
  return true;
}

auto MemoryCache::adjust(std::string_view key, std::int64_t delta,
                         bool floor_zero) -> Result<std::int64_t> {
  std::lock_guard lock(mu_);
  auto now = clock_->now();
  auto it = find_live(key, now);

  if (it == storage_.end()) {
    std::int64_t initial = floor_zero ? std::max<std::int64_t>(0, delta) : delta;
    storage_.emplace(std::string(key), Entry{initial, TimePoint{}, ++access_tick_});
    ++stats_.writes;
    return initial;
  }

  auto current = numeric_value(it->second.value);
  if (!current) {
    return fail(Error::NotNumeric);
  }
  std::int64_t next = *current + delta;
  if (floor_zero) {
    next = std::max<std::int64_t>(0, next);
  }
  it->second.value = next;
  it->second.last_access = ++access_tick_;
  return next;
}

auto MemoryCache::increment(std::string_view key, std::int64_t delta)
    -> Result<std::int64_t> {
  return adjust(key, delta, false);
}

auto MemoryCache::decrement(std::string_view key, std::int64_t delta)
    -> Result<std::int64_t> {
  return adjust(key, -delta, true);
}

auto MemoryCache::evict_lru() -> bool {
  if (storage_.empty()) {
    return false;
  }
  auto oldest = std::ranges::min_element(
      storage_, {}, [](const auto& kv) { return kv.second.last_access; });
  storage_.erase(oldest);
  ++stats_.evictions;
  return true;
}

auto MemoryCache::gc_locked(TimePoint now) -> std::size_t {
  return std::erase_if(storage_, [this, now](const auto& kv) {
    return is_expired(kv.second, now);
  });
}

auto MemoryCache::gc() -> std::size_t {
  std::lock_guard lock(mu_);
  return gc_locked(clock_->now());
}

auto MemoryCache::flush() -> void {
  std::lock_guard lock(mu_);
  storage_.clear();
  stats_ = {};
}

auto MemoryCache::stats() const -> CacheStats {
  std::lock_guard lock(mu_);
  return stats_;
}

auto MemoryCache::reset_stats() -> void {
  std::lock_guard lock(mu_);
  stats_ = {};
}

auto MemoryCache::keys() const -> std::vector<std::string> {
  std::lock_guard lock(mu_);
  std::vector<std::string> out;
  out.reserve(storage_.size());
  for (const auto& [key, _] : storage_) {
    out.push_back(key);
  }
  return out;
}

auto MemoryCache::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return storage_.size();
}

auto MemoryCache::max_items() const -> std::size_t {
  std::lock_guard lock(mu_);
  return max_items_;
}

auto MemoryCache::set_max_items(std::size_t max_items) -> void {
  std::lock_guard lock(mu_);
  max_items_ = max_items;
  if (max_items_ == 0) {
    return;
  }
  while (storage_.size() > max_items_ && evict_lru()) {
  }
}

}  // namespace upkeep
