#include "upkeep/cache/cache_factory.hpp"

#include "upkeep/util/log.hpp"

namespace upkeep {

CacheFactory::CacheFactory(CacheEnvironment env) : env_(env) {
}

auto CacheFactory::set_environment(CacheEnvironment env) -> void {
  std::lock_guard lock(mu_);
  env_ = env;
}

auto CacheFactory::create_locked(std::string prefix) const
    -> std::shared_ptr<Cache> {
  if (env_.object_cache && env_.object_cache->available()) {
    return std::make_shared<ObjectCache>(*env_.object_cache, std::move(prefix));
  }
  if (env_.store) {
    return std::make_shared<TransientCache>(*env_.store, std::move(prefix),
                                            clock());
  }
  log::warn("No object cache or durable store available, caching disabled");
  return std::make_shared<NullCache>();
}

auto CacheFactory::create(std::optional<std::string> prefix)
    -> std::shared_ptr<Cache> {
  std::lock_guard lock(mu_);
  return create_locked(prefix.value_or(default_prefix_));
}

auto CacheFactory::get_instance() -> std::shared_ptr<Cache> {
  std::lock_guard lock(mu_);
  if (!instance_) {
    instance_ = create_locked(default_prefix_);
    log::debug("Cache backend selected: {}",
               to_string_view(instance_->backend()));
  }
  return instance_;
}

auto CacheFactory::set_instance(std::shared_ptr<Cache> instance) -> void {
  std::lock_guard lock(mu_);
  instance_ = std::move(instance);
}

auto CacheFactory::reset() -> void {
  std::lock_guard lock(mu_);
  instance_.reset();
}

auto CacheFactory::reset_all() -> void {
  std::lock_guard lock(mu_);
  instance_.reset();
  default_prefix_ = kDefaultPrefix;
}

auto CacheFactory::get_backend_type() const -> CacheBackend {
  std::lock_guard lock(mu_);
  if (!instance_) {
    return CacheBackend::None;
  }
  return instance_->backend();
}

auto CacheFactory::has_persistent_cache() const -> bool {
  std::lock_guard lock(mu_);
  return env_.object_cache && env_.object_cache->available();
}

auto CacheFactory::create_object_cache(std::string group) const
    -> Result<std::shared_ptr<ObjectCache>> {
  std::lock_guard lock(mu_);
  if (!env_.object_cache) {
    return fail(Error::Unsupported);
  }
  return std::make_shared<ObjectCache>(*env_.object_cache, std::move(group));
}

auto CacheFactory::create_transient_cache(std::string prefix) const
    -> Result<std::shared_ptr<TransientCache>> {
  std::lock_guard lock(mu_);
  if (!env_.store) {
    return fail(Error::Unsupported);
  }
  return std::make_shared<TransientCache>(*env_.store, std::move(prefix),
                                          clock());
}

auto CacheFactory::create_memory_cache(std::size_t max_items) const
    -> std::shared_ptr<MemoryCache> {
  std::lock_guard lock(mu_);
  return std::make_shared<MemoryCache>(max_items, clock());
}

auto CacheFactory::create_null_cache() const -> std::shared_ptr<NullCache> {
  return std::make_shared<NullCache>();
}

auto CacheFactory::set_default_prefix(std::string prefix) -> void {
  std::lock_guard lock(mu_);
  default_prefix_ = std::move(prefix);
}

auto CacheFactory::default_prefix() const -> std::string {
  std::lock_guard lock(mu_);
  return default_prefix_;
}

auto default_cache_factory() -> CacheFactory& {
  static CacheFactory instance;
  return instance;
}

}  // namespace upkeep
