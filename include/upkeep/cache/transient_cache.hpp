#pragma once

#include "upkeep/cache/cache.hpp"
#include "upkeep/storage/kv_store.hpp"
#include "upkeep/util/clock.hpp"

#include <cstddef>
#include <string>

namespace upkeep {

// Cache persisted in the durable key/value store, used when the host has no
// external object cache. Each entry is a value row holding a
// {"found": true, "value": ...} envelope plus, when a TTL is given, a
// timeout row holding the expiry in epoch seconds.
//
// Storage failures are logged and reported as misses or `false`.
class TransientCache final : public Cache {
public:
  static constexpr std::string_view kValuePrefix = "_transient_";
  static constexpr std::string_view kTimeoutPrefix = "_transient_timeout_";
  static constexpr std::size_t kMaxKeyLength = 172;
  // Longest stored key that still fits once kTimeoutPrefix is prepended.
  static constexpr std::size_t kMaxStoredKey =
      kMaxKeyLength - kTimeoutPrefix.size();

  explicit TransientCache(KvStore& store, std::string prefix = "upkeep_",
                          const Clock& clock = system_clock());

  [[nodiscard]] auto get(std::string_view key)
      -> std::optional<CacheValue> override;
  auto set(std::string_view key, const CacheValue& value,
           std::chrono::seconds ttl = std::chrono::seconds{0}) -> bool override;
  auto remove(std::string_view key) -> bool override;
  [[nodiscard]] auto has(std::string_view key) -> bool override;
  auto clear(std::string_view prefix = {}) -> bool override;
  // The existing expiry is kept; a missing key starts from zero.
  auto increment(std::string_view key, std::int64_t delta = 1)
      -> Result<std::int64_t> override;
  auto decrement(std::string_view key, std::int64_t delta = 1)
      -> Result<std::int64_t> override;

  [[nodiscard]] auto backend() const noexcept -> CacheBackend override {
    return CacheBackend::Transient;
  }

  [[nodiscard]] auto prefix() const noexcept -> const std::string& {
    return prefix_;
  }

  // prefix + key, shortened to kMaxStoredKey with an MD5 suffix when too
  // long. Deterministic, so the same logical key always maps to one row.
  [[nodiscard]] static auto build_key(std::string_view prefix,
                                      std::string_view key) -> std::string;
  [[nodiscard]] static auto value_row(std::string_view stored_key)
      -> std::string;
  [[nodiscard]] static auto timeout_row(std::string_view stored_key)
      -> std::string;
  [[nodiscard]] static auto wrap(const CacheValue& value) -> std::string;
  [[nodiscard]] static auto unwrap(std::string_view raw)
      -> std::optional<CacheValue>;

private:
  [[nodiscard]] auto build_key(std::string_view key) const -> std::string {
    return build_key(prefix_, key);
  }
  // Value of a live entry; an expired entry is deleted and reads as absent.
  [[nodiscard]] auto load(const std::string& stored_key)
      -> std::optional<CacheValue>;
  auto adjust(std::string_view key, std::int64_t delta, bool floor_zero)
      -> Result<std::int64_t>;

  KvStore* store_;
  std::string prefix_;
  const Clock* clock_;
};

}  // namespace upkeep
