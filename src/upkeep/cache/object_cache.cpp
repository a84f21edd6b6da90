#include "upkeep/cache/object_cache.hpp"

#include "upkeep/util/log.hpp"

#include <algorithm>

namespace upkeep {

ObjectCache::ObjectCache(ObjectCacheBackend& backend, std::string group)
    : backend_(&backend), group_(std::move(group)) {
}

auto ObjectCache::get(std::string_view key) -> std::optional<CacheValue> {
  return backend_->get(group_, key);
}

auto ObjectCache::set(std::string_view key, const CacheValue& value,
                      std::chrono::seconds ttl) -> bool {
  return backend_->set(group_, key, value, ttl);
}

auto ObjectCache::remove(std::string_view key) -> bool {
  return backend_->remove(group_, key);
}

auto ObjectCache::has(std::string_view key) -> bool {
  return backend_->get(group_, key).has_value();
}

auto ObjectCache::clear(std::string_view prefix) -> bool {
  if (!prefix.empty()) {
    log::debug("Object cache cannot clear by prefix '{}' in group {}", prefix,
               group_);
    return false;
  }
  if (!backend_->supports_group_flush()) {
    log::warn("Object cache backend cannot flush group {}", group_);
    return false;
  }
  return backend_->flush_group(group_);
}

auto ObjectCache::increment(std::string_view key, std::int64_t delta)
    -> Result<std::int64_t> {
  return backend_->increment(group_, key, delta);
}

auto ObjectCache::decrement(std::string_view key, std::int64_t delta)
    -> Result<std::int64_t> {
  auto r = backend_->decrement(group_, key, delta);
  if (!r) {
    return r;
  }
  return std::max<std::int64_t>(0, *r);
}

}  // namespace upkeep
