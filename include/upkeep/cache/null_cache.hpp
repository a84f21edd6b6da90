#pragma once

#include "upkeep/cache/cache.hpp"

namespace upkeep {

// Stores nothing. Every write reports success and every read misses.
class NullCache final : public Cache {
public:
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
  auto remember(std::string_view key, const Producer& producer,
                std::chrono::seconds ttl = std::chrono::seconds{0})
      -> CacheValue override;

  [[nodiscard]] auto backend() const noexcept -> CacheBackend override {
    return CacheBackend::Null;
  }
};

}  // namespace upkeep
