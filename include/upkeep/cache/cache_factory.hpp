#pragma once

#include "upkeep/cache/cache.hpp"
#include "upkeep/cache/memory_cache.hpp"
#include "upkeep/cache/null_cache.hpp"
#include "upkeep/cache/object_cache.hpp"
#include "upkeep/cache/transient_cache.hpp"
#include "upkeep/storage/kv_store.hpp"
#include "upkeep/util/clock.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace upkeep {

// What the host offers the cache layer. Either pointer may be null.
struct CacheEnvironment {
  ObjectCacheBackend* object_cache{nullptr};
  KvStore* store{nullptr};
  const Clock* clock{nullptr};
};

// Picks the cache backend for the environment and holds the shared
// instance. Components receive the resulting Cache explicitly; the shared
// instance is for the composition root and for tests that swap it.
class CacheFactory {
public:
  static constexpr std::string_view kDefaultPrefix = "upkeep_";

  explicit CacheFactory(CacheEnvironment env = {});

  auto set_environment(CacheEnvironment env) -> void;

  // Object cache when the host has a persistent one, otherwise the durable
  // store fallback. With neither, a NullCache.
  [[nodiscard]] auto create(std::optional<std::string> prefix = std::nullopt)
      -> std::shared_ptr<Cache>;

  [[nodiscard]] auto get_instance() -> std::shared_ptr<Cache>;
  auto set_instance(std::shared_ptr<Cache> instance) -> void;
  auto reset() -> void;
  // Also restores the default prefix.
  auto reset_all() -> void;

  // Backend of the current instance, CacheBackend::None when there is none.
  // Never creates an instance.
  [[nodiscard]] auto get_backend_type() const -> CacheBackend;
  [[nodiscard]] auto has_persistent_cache() const -> bool;

  [[nodiscard]] auto create_object_cache(std::string group = "upkeep_") const
      -> Result<std::shared_ptr<ObjectCache>>;
  [[nodiscard]] auto create_transient_cache(std::string prefix = "upkeep_") const
      -> Result<std::shared_ptr<TransientCache>>;
  [[nodiscard]] auto create_memory_cache(
      std::size_t max_items = MemoryCache::kDefaultMaxItems) const
      -> std::shared_ptr<MemoryCache>;
  [[nodiscard]] auto create_null_cache() const -> std::shared_ptr<NullCache>;

  auto set_default_prefix(std::string prefix) -> void;
  [[nodiscard]] auto default_prefix() const -> std::string;

private:
  [[nodiscard]] auto clock() const -> const Clock& {
    return env_.clock ? *env_.clock : system_clock();
  }
  [[nodiscard]] auto create_locked(std::string prefix) const
      -> std::shared_ptr<Cache>;

  mutable std::mutex mu_;
  CacheEnvironment env_;
  std::string default_prefix_{kDefaultPrefix};
  std::shared_ptr<Cache> instance_;
};

// Process-wide factory used by the application entry point.
[[nodiscard]] auto default_cache_factory() -> CacheFactory&;

}  // namespace upkeep
