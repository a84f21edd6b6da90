#pragma once

#include "upkeep/cache/cache.hpp"
#include "upkeep/cache/object_cache_backend.hpp"

#include <string>

namespace upkeep {

// Cache over the host's distributed object cache. All keys live in one
// group; prefix-scoped clears are not supported by such backends and fail
// explicitly.
class ObjectCache final : public Cache {
public:
  explicit ObjectCache(ObjectCacheBackend& backend,
                       std::string group = "upkeep_");

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
    return CacheBackend::Object;
  }
  [[nodiscard]] auto supports_atomic_increment() const noexcept
      -> bool override {
    return true;
  }

  [[nodiscard]] auto group() const noexcept -> const std::string& {
    return group_;
  }

private:
  ObjectCacheBackend* backend_;
  std::string group_;
};

}  // namespace upkeep
