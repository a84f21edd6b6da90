#include "upkeep/cache/null_cache.hpp"

#include <algorithm>

namespace upkeep {

auto NullCache::get(std::string_view) -> std::optional<CacheValue> {
  return std::nullopt;
}

auto NullCache::set(std::string_view, const CacheValue&, std::chrono::seconds)
    -> bool {
  return true;
}

auto NullCache::remove(std::string_view) -> bool {
  return true;
}

auto NullCache::has(std::string_view) -> bool {
  return false;
}

auto NullCache::clear(std::string_view) -> bool {
  return true;
}

auto NullCache::increment(std::string_view, std::int64_t delta)
    -> Result<std::int64_t> {
  return delta;
}

auto NullCache::decrement(std::string_view, std::int64_t delta)
    -> Result<std::int64_t> {
  return std::max<std::int64_t>(0, -delta);
}

auto NullCache::remember(std::string_view, const Producer& producer,
                         std::chrono::seconds) -> CacheValue {
  return producer();
}

}  // namespace upkeep
