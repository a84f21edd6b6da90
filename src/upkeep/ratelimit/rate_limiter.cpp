#include "upkeep/ratelimit/rate_limiter.hpp"

#include "upkeep/cache/transient_cache.hpp"
#include "upkeep/util/log.hpp"
#include "upkeep/util/time.hpp"

#include <charconv>
#include <thread>

namespace upkeep {

namespace {

auto lock_key(std::string_view prefix, std::string_view caller_id)
    -> std::string {
  std::string key{"rl_lock_"};
  key.append(caller_id);
  return TransientCache::build_key(prefix, key);
}

auto parse_seconds(std::string_view raw) -> std::optional<std::int64_t> {
  std::int64_t secs = 0;
  auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), secs);
  if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
    return std::nullopt;
  }
  return secs;
}

}  // namespace

RateLimiter::RateLimiter(RateLimitConfig config, Cache& cache, KvStore& store,
                         const Clock& clock)
    : config_(std::move(config)), cache_(&cache), store_(&store),
      clock_(&clock) {
}

auto RateLimiter::counter_key(std::string_view caller_id) -> std::string {
  std::string key{"rate_limit_"};
  key.append(caller_id);
  return key;
}

auto RateLimiter::check(std::string_view caller_id) -> Result<void> {
  if (caller_id.empty() || config_.requests_per_minute <= 0) {
    return ok();
  }
  if (cache_->supports_atomic_increment()) {
    return check_atomic(caller_id);
  }
  return check_with_lock(caller_id);
}

auto RateLimiter::check_atomic(std::string_view caller_id) -> Result<void> {
  auto key = counter_key(caller_id);
  auto count = cache_->increment(key, 1);
  if (!count) {
    if (count.error() == make_error_code(Error::NotFound)) {
      if (!cache_->set(key, 1, kWindow)) {
        log::warn("Rate limiter could not start window for {}", caller_id);
        return fail(Error::RateLimiterUnavailable);
      }
      return ok();
    }
    log::warn("Rate limiter increment failed for {}: {}", caller_id,
              count.error().message());
    return fail(Error::RateLimiterUnavailable);
  }

  if (*count > config_.requests_per_minute) {
    log::info("Rate limit exceeded for {} ({} > {})", caller_id, *count,
              config_.requests_per_minute);
    return fail(Error::RateLimitExceeded);
  }
  return ok();
}

auto RateLimiter::acquire_lock(const std::string& stored_lock_key) -> bool {
  auto vrow = TransientCache::value_row(stored_lock_key);
  auto trow = TransientCache::timeout_row(stored_lock_key);

  // An abandoned lock is cleared once and the insert retried.
  for (int pass = 0; pass < 2; ++pass) {
    auto now = util::to_unix_seconds(clock_->now());
    auto expiry = std::to_string(now + config_.lock_ttl.count());
    auto inserted =
        store_->insert_pair_if_absent(trow, expiry, vrow, TransientCache::wrap(1));
    if (!inserted) {
      log::warn("Rate limiter lock insert failed for {}: {}", stored_lock_key,
                inserted.error().message());
      return false;
    }
    if (*inserted == 2) {
      return true;
    }

    bool abandoned = (*inserted == 1);
    if (!abandoned) {
      auto existing = store_->get(trow);
      if (!existing) {
        log::warn("Rate limiter lock read failed for {}: {}", stored_lock_key,
                  existing.error().message());
        return false;
      }
      auto held_until =
          *existing ? parse_seconds(**existing) : std::optional<std::int64_t>{};
      abandoned = !held_until || *held_until < now;
    }
    if (!abandoned || pass > 0) {
      return false;
    }

    log::debug("Clearing expired rate limiter lock {}", stored_lock_key);
    if (auto r = store_->remove_pair(trow, vrow); !r) {
      return false;
    }
  }
  return false;
}

auto RateLimiter::release_lock(const std::string& stored_lock_key) -> void {
  auto r = store_->remove_pair(TransientCache::value_row(stored_lock_key),
                               TransientCache::timeout_row(stored_lock_key));
  if (!r) {
    log::warn("Rate limiter lock release failed for {}: {}", stored_lock_key,
              r.error().message());
  }
}

auto RateLimiter::check_with_lock(std::string_view caller_id) -> Result<void> {
  auto stored_lock_key = lock_key(config_.key_prefix, caller_id);

  bool acquired = false;
  for (int attempt = 0; attempt < config_.lock_attempts; ++attempt) {
    if (acquire_lock(stored_lock_key)) {
      acquired = true;
      break;
    }
    if (attempt + 1 < config_.lock_attempts) {
      std::this_thread::sleep_for(config_.lock_backoff);
    }
  }
  if (!acquired) {
    log::warn("Rate limiter lock unavailable for {} after {} attempts",
              caller_id, config_.lock_attempts);
    return fail(Error::RateLimiterUnavailable);
  }

  struct Guard {
    RateLimiter* self;
    const std::string& key;
    ~Guard() { self->release_lock(key); }
  } guard{this, stored_lock_key};

  // The counter lives in the durable store next to the lock so every process
  // sharing the store sees one count, whatever the configured cache is.
  TransientCache counters{*store_, config_.key_prefix, *clock_};
  auto key = counter_key(caller_id);
  auto current = counters.get(key);
  if (!current) {
    if (!counters.set(key, 1, kWindow)) {
      return fail(Error::RateLimiterUnavailable);
    }
    return ok();
  }

  auto requests = numeric_value(*current);
  if (!requests) {
    log::warn("Rate limiter counter for {} is not numeric, restarting window",
              caller_id);
    requests = 0;
  }
  if (*requests >= config_.requests_per_minute) {
    log::info("Rate limit exceeded for {} ({} requests)", caller_id,
              *requests);
    return fail(Error::RateLimitExceeded);
  }
  if (!counters.set(key, *requests + 1, kWindow)) {
    return fail(Error::RateLimiterUnavailable);
  }
  return ok();
}

}  // namespace upkeep
