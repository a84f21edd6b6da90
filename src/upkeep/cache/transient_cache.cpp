#include "upkeep/cache/transient_cache.hpp"

#include "upkeep/util/hash.hpp"
#include "upkeep/util/log.hpp"
#include "upkeep/util/time.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>

namespace upkeep {

namespace {

constexpr std::size_t kHashSuffixLength = 33;  // '_' + 32 hex chars

auto parse_expiry(std::string_view raw) -> std::optional<std::int64_t> {
  std::int64_t secs = 0;
  auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), secs);
  if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
    return std::nullopt;
  }
  return secs;
}

}  // namespace

TransientCache::TransientCache(KvStore& store, std::string prefix,
                               const Clock& clock)
    : store_(&store), prefix_(std::move(prefix)), clock_(&clock) {
}

auto TransientCache::build_key(std::string_view prefix, std::string_view key)
    -> std::string {
  std::string full;
  full.reserve(prefix.size() + key.size());
  full.append(prefix).append(key);
  if (full.size() <= kMaxStoredKey) {
    return full;
  }
  auto hash = util::md5_hex(full);
  full.resize(kMaxStoredKey - kHashSuffixLength);
  full.push_back('_');
  full.append(hash);
  return full;
}

auto TransientCache::value_row(std::string_view stored_key) -> std::string {
  std::string row{kValuePrefix};
  row.append(stored_key);
  return row;
}

auto TransientCache::timeout_row(std::string_view stored_key) -> std::string {
  std::string row{kTimeoutPrefix};
  row.append(stored_key);
  return row;
}

auto TransientCache::wrap(const CacheValue& value) -> std::string {
  return nlohmann::json{{"found", true}, {"value", value}}.dump();
}

auto TransientCache::unwrap(std::string_view raw)
    -> std::optional<CacheValue> {
  auto parsed = nlohmann::json::parse(raw, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  auto found = parsed.find("found");
  auto value = parsed.find("value");
  if (found == parsed.end() || !found->is_boolean() || !found->get<bool>() ||
      value == parsed.end()) {
    return std::nullopt;
  }
  return std::move(*value);
}

auto TransientCache::load(const std::string& stored_key)
    -> std::optional<CacheValue> {
  auto vrow = value_row(stored_key);
  auto trow = timeout_row(stored_key);

  auto timeout = store_->get(trow);
  if (!timeout) {
    log::warn("Transient read failed for {}: {}", stored_key,
              timeout.error().message());
    return std::nullopt;
  }
  if (*timeout) {
    auto expiry = parse_expiry(**timeout);
    if (expiry && util::to_unix_seconds(clock_->now()) >= *expiry) {
      if (auto r = store_->remove_pair(vrow, trow); !r) {
        log::warn("Failed to drop expired transient {}: {}", stored_key,
                  r.error().message());
      }
      return std::nullopt;
    }
  }

  auto raw = store_->get(vrow);
  if (!raw) {
    log::warn("Transient read failed for {}: {}", stored_key,
              raw.error().message());
    return std::nullopt;
  }
  if (!*raw) {
    return std::nullopt;
  }
  return unwrap(**raw);
}

auto TransientCache::get(std::string_view key) -> std::optional<CacheValue> {
  return load(build_key(key));
}

auto TransientCache::has(std::string_view key) -> bool {
  return load(build_key(key)).has_value();
}

auto TransientCache::set(std::string_view key, const CacheValue& value,
                         std::chrono::seconds ttl) -> bool {
  auto stored = build_key(key);
  auto trow = timeout_row(stored);

  if (ttl.count() > 0) {
    // Rounded up so a sub-second clock never shortens the TTL.
    auto expiry = util::to_unix_seconds(
        std::chrono::ceil<std::chrono::seconds>(clock_->now() + ttl));
    if (auto r = store_->put(trow, std::to_string(expiry)); !r) {
      log::warn("Transient write failed for {}: {}", stored,
                r.error().message());
      return false;
    }
  } else if (auto r = store_->remove(trow); !r) {
    log::warn("Transient write failed for {}: {}", stored, r.error().message());
    return false;
  }

  if (auto r = store_->put(value_row(stored), wrap(value)); !r) {
    log::warn("Transient write failed for {}: {}", stored, r.error().message());
    return false;
  }
  return true;
}

auto TransientCache::remove(std::string_view key) -> bool {
  auto stored = build_key(key);
  auto removed = store_->remove(value_row(stored));
  if (!removed) {
    log::warn("Transient delete failed for {}: {}", stored,
              removed.error().message());
    return false;
  }
  if (auto r = store_->remove(timeout_row(stored)); !r) {
    log::warn("Transient delete failed for {}: {}", stored,
              r.error().message());
    return false;
  }
  return *removed;
}

auto TransientCache::clear(std::string_view prefix) -> bool {
  auto stored = build_key(prefix);
  auto values = store_->remove_prefix(value_row(stored));
  if (!values) {
    log::warn("Transient clear failed for '{}': {}", stored,
              values.error().message());
    return false;
  }
  auto timeouts = store_->remove_prefix(timeout_row(stored));
  if (!timeouts) {
    log::warn("Transient clear failed for '{}': {}", stored,
              timeouts.error().message());
    return false;
  }
  log::debug("Cleared {} transient entries under '{}'", *values, stored);
  return true;
}

auto TransientCache::adjust(std::string_view key, std::int64_t delta,
                            bool floor_zero) -> Result<std::int64_t> {
  auto stored = build_key(key);
  std::int64_t current = 0;
  if (auto value = load(stored)) {
    auto n = numeric_value(*value);
    if (!n) {
      return fail(Error::NotNumeric);
    }
    current = *n;
  }

  auto next = current + delta;
  if (floor_zero) {
    next = std::max<std::int64_t>(0, next);
  }
  if (auto r = store_->put(value_row(stored), wrap(next)); !r) {
    log::warn("Transient write failed for {}: {}", stored, r.error().message());
    return fail(r.error());
  }
  return next;
}

auto TransientCache::increment(std::string_view key, std::int64_t delta)
    -> Result<std::int64_t> {
  return adjust(key, delta, false);
}

auto TransientCache::decrement(std::string_view key, std::int64_t delta)
    -> Result<std::int64_t> {
  return adjust(key, -delta, true);
}

}  // namespace upkeep
