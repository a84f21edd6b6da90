#pragma once

#include "upkeep/core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace upkeep {

// Host-provided distributed cache (memcached/redis style), addressed by
// group + key. The embedding application supplies the implementation.
class ObjectCacheBackend {
public:
  virtual ~ObjectCacheBackend() = default;

  // Whether a persistent external cache is actually configured in the host.
  [[nodiscard]] virtual auto available() const -> bool = 0;

  [[nodiscard]] virtual auto get(std::string_view group, std::string_view key)
      -> std::optional<nlohmann::json> = 0;
  virtual auto set(std::string_view group, std::string_view key,
                   const nlohmann::json& value, std::chrono::seconds ttl)
      -> bool = 0;
  virtual auto remove(std::string_view group, std::string_view key)
      -> bool = 0;

  // Atomic in the backend. Error::NotFound for a missing key,
  // Error::NotNumeric for a non-numeric value. decrement floors at zero.
  virtual auto increment(std::string_view group, std::string_view key,
                         std::int64_t delta) -> Result<std::int64_t> = 0;
  virtual auto decrement(std::string_view group, std::string_view key,
                         std::int64_t delta) -> Result<std::int64_t> = 0;

  [[nodiscard]] virtual auto supports_group_flush() const -> bool = 0;
  virtual auto flush_group(std::string_view group) -> bool = 0;
};

}  // namespace upkeep
