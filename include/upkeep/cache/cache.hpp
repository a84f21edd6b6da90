#pragma once

#include "upkeep/core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace upkeep {

using CacheValue = nlohmann::json;

enum class CacheBackend : std::uint8_t {
  None,
  Object,
  Transient,
  Memory,
  Null,
  Unknown,
};

[[nodiscard]] constexpr auto to_string_view(CacheBackend backend) noexcept
    -> std::string_view {
  switch (backend) {
    case CacheBackend::None: return "none";
    case CacheBackend::Object: return "object";
    case CacheBackend::Transient: return "transient";
    case CacheBackend::Memory: return "memory";
    case CacheBackend::Null: return "null";
    case CacheBackend::Unknown: return "unknown";
  }
  return "unknown";
}

// Common contract of every cache backend.
//
// Lookups return std::nullopt for "absent", so a stored `false` or `null` is
// a hit. A TTL of zero means the entry never expires.
class Cache {
public:
  using Producer = std::function<CacheValue()>;

  virtual ~Cache() = default;

  [[nodiscard]] virtual auto get(std::string_view key)
      -> std::optional<CacheValue> = 0;
  virtual auto set(std::string_view key, const CacheValue& value,
                   std::chrono::seconds ttl = std::chrono::seconds{0})
      -> bool = 0;
  virtual auto remove(std::string_view key) -> bool = 0;
  [[nodiscard]] virtual auto has(std::string_view key) -> bool = 0;

  // Empty prefix clears everything the backend owns.
  virtual auto clear(std::string_view prefix = {}) -> bool = 0;

  // Fails with Error::NotNumeric when the stored value is not a number.
  virtual auto increment(std::string_view key, std::int64_t delta = 1)
      -> Result<std::int64_t> = 0;
  // Same as increment but never goes below zero.
  virtual auto decrement(std::string_view key, std::int64_t delta = 1)
      -> Result<std::int64_t> = 0;

  [[nodiscard]] auto get_or(std::string_view key, CacheValue fallback)
      -> CacheValue {
    if (auto value = get(key)) {
      return std::move(*value);
    }
    return fallback;
  }

  // Returns the cached value, or runs `producer`, stores and returns its
  // result. Exceptions thrown by `producer` propagate and nothing is stored.
  virtual auto remember(std::string_view key, const Producer& producer,
                        std::chrono::seconds ttl = std::chrono::seconds{0})
      -> CacheValue {
    if (auto value = get(key)) {
      return std::move(*value);
    }
    CacheValue value = producer();
    set(key, value, ttl);
    return value;
  }

  [[nodiscard]] virtual auto get_multiple(const std::vector<std::string>& keys,
                                          const CacheValue& fallback = nullptr)
      -> std::map<std::string, CacheValue> {
    std::map<std::string, CacheValue> out;
    for (const auto& key : keys) {
      out.insert_or_assign(key, get_or(key, fallback));
    }
    return out;
  }

  virtual auto set_multiple(const std::map<std::string, CacheValue>& values,
                            std::chrono::seconds ttl = std::chrono::seconds{0})
      -> bool {
    bool all = true;
    for (const auto& [key, value] : values) {
      all = set(key, value, ttl) && all;
    }
    return all;
  }

  virtual auto delete_multiple(const std::vector<std::string>& keys) -> bool {
    bool all = true;
    for (const auto& key : keys) {
      all = remove(key) && all;
    }
    return all;
  }

  [[nodiscard]] virtual auto backend() const noexcept -> CacheBackend {
    return CacheBackend::Unknown;
  }

  // True when increment() is a single atomic operation in the backend and
  // reports Error::NotFound for a missing key instead of creating it.
  [[nodiscard]] virtual auto supports_atomic_increment() const noexcept
      -> bool {
    return false;
  }
};

// Integer view of a cached value. Numeric strings count as numbers;
// booleans, null and containers do not.
[[nodiscard]] auto numeric_value(const CacheValue& value)
    -> std::optional<std::int64_t>;

}  // namespace upkeep
