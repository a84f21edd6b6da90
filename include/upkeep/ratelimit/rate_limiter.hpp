#pragma once

#include "upkeep/cache/cache.hpp"
#include "upkeep/core/error.hpp"
#include "upkeep/storage/kv_store.hpp"
#include "upkeep/util/clock.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace upkeep {

struct RateLimitConfig {
  // <= 0 disables limiting.
  int requests_per_minute{60};
  int lock_attempts{5};
  std::chrono::milliseconds lock_backoff{50};
  std::chrono::seconds lock_ttl{5};
  // Storage prefix of the lock rows; matches the cache prefix.
  std::string key_prefix{"upkeep_"};
};

// Per-caller requests-per-minute limiter.
//
// With an atomic-increment cache the counter is bumped in one operation.
// Otherwise a short-lived lock is taken by inserting a value row and an
// expiry row into the durable store in one statement, and a counter kept in
// the same store under the same prefix is read, checked and written while the
// lock is held. When the lock cannot be obtained the request is rejected.
class RateLimiter {
public:
  static constexpr std::chrono::seconds kWindow{60};

  RateLimiter(RateLimitConfig config, Cache& cache, KvStore& store,
              const Clock& clock = system_clock());

  // Error::RateLimitExceeded when the caller is over its limit,
  // Error::RateLimiterUnavailable when the lock could not be acquired or
  // the counter could not be read.
  [[nodiscard]] auto check(std::string_view caller_id) -> Result<void>;

  [[nodiscard]] auto config() const noexcept -> const RateLimitConfig& {
    return config_;
  }

  [[nodiscard]] static auto counter_key(std::string_view caller_id)
      -> std::string;

private:
  [[nodiscard]] auto check_atomic(std::string_view caller_id) -> Result<void>;
  [[nodiscard]] auto check_with_lock(std::string_view caller_id)
      -> Result<void>;
  [[nodiscard]] auto acquire_lock(const std::string& stored_lock_key) -> bool;
  auto release_lock(const std::string& stored_lock_key) -> void;

  RateLimitConfig config_;
  Cache* cache_;
  KvStore* store_;
  const Clock* clock_;
};

}  // namespace upkeep
