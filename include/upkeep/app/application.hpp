#pragma once

#include "upkeep/cache/cache_factory.hpp"
#include "upkeep/config/config.hpp"
#include "upkeep/core/error.hpp"
#include "upkeep/ratelimit/rate_limiter.hpp"
#include "upkeep/scheduler/local_scheduler.hpp"
#include "upkeep/scheduler/scheduling_service.hpp"
#include "upkeep/storage/sqlite_store.hpp"
#include "upkeep/task/task_runner.hpp"

#include <atomic>
#include <memory>

namespace upkeep {

// Composition root: wires storage, cache, scheduling, the task runner and
// the rate limiter from one Config. Tasks are registered by the embedder.
class Application {
public:
  explicit Application(Config config, const Clock& clock = system_clock(),
                       CacheFactory& factory = default_cache_factory());
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Must be called before init(). Null means the host has no object cache.
  auto set_object_cache_backend(ObjectCacheBackend* backend) -> void;

  [[nodiscard]] auto init() -> Result<void>;
  [[nodiscard]] auto is_initialized() const noexcept -> bool {
    return initialized_;
  }

  [[nodiscard]] auto register_task(std::unique_ptr<MaintenanceTask> task)
      -> Result<void>;

  // Runs every task whose queued time has passed. Returns how many ran.
  auto tick() -> std::size_t;

  // Ticks every runner.tick_interval_ms until stop is set.
  auto run(const std::atomic<bool>& stop) -> void;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }
  [[nodiscard]] auto store() noexcept -> SqliteStore& {
    return store_;
  }
  [[nodiscard]] auto host_scheduler() noexcept -> LocalScheduler& {
    return host_;
  }
  [[nodiscard]] auto scheduling() noexcept -> SchedulingService& {
    return scheduling_;
  }
  [[nodiscard]] auto runner() noexcept -> TaskRunner& {
    return runner_;
  }
  // Valid after a successful init().
  [[nodiscard]] auto cache() noexcept -> Cache& {
    return *cache_;
  }
  [[nodiscard]] auto rate_limiter() noexcept -> RateLimiter& {
    return *rate_limiter_;
  }

private:
  [[nodiscard]] auto build_cache() -> Result<std::shared_ptr<Cache>>;

  Config config_;
  const Clock* clock_;
  CacheFactory* factory_;
  ObjectCacheBackend* object_cache_{nullptr};
  bool initialized_{false};

  SqliteStore store_;
  LocalScheduler host_;
  SchedulingService scheduling_;
  TaskRunner runner_;
  std::shared_ptr<Cache> cache_;
  std::unique_ptr<RateLimiter> rate_limiter_;
};

}  // namespace upkeep
