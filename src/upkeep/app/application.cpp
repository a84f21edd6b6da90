#include "upkeep/app/application.hpp"

#include "upkeep/util/log.hpp"

#include <algorithm>
#include <thread>

namespace upkeep {

namespace {

auto make_runner_options(const RunnerConfig& cfg) -> RunnerOptions {
  RunnerOptions options;
  options.budget.time_limit = std::chrono::seconds{cfg.time_limit_sec};
  options.budget.time_buffer = std::chrono::seconds{cfg.time_buffer_sec};
  options.resume_delay = std::chrono::seconds{cfg.resume_delay_sec};
  return options;
}

auto make_rate_limit_config(const Config& cfg) -> RateLimitConfig {
  RateLimitConfig out;
  out.requests_per_minute = cfg.rate_limit.requests_per_minute;
  out.lock_attempts = cfg.rate_limit.lock_attempts;
  out.lock_backoff = std::chrono::milliseconds{cfg.rate_limit.lock_backoff_ms};
  out.lock_ttl = std::chrono::seconds{cfg.rate_limit.lock_ttl_sec};
  out.key_prefix = cfg.cache.prefix;
  return out;
}

}  // namespace

Application::Application(Config config, const Clock& clock,
                         CacheFactory& factory)
    : config_(std::move(config)), clock_(&clock), factory_(&factory),
      store_(config_.storage.db_file), host_(store_),
      scheduling_(config_.scheduling, host_, store_, clock,
                  std::chrono::seconds{config_.runner.stale_threshold_sec}),
      runner_(store_, host_, scheduling_, clock,
              make_runner_options(config_.runner)) {
}

Application::~Application() {
  if (initialized_) {
    // The factory outlives us; it must not keep pointers into this object.
    factory_->reset();
    factory_->set_environment({});
  }
}

auto Application::set_object_cache_backend(ObjectCacheBackend* backend)
    -> void {
  object_cache_ = backend;
}

auto Application::init() -> Result<void> {
  if (initialized_) {
    return ok();
  }
  if (auto r = store_.open(); !r) {
    log::error("Failed to open store {}: {}", store_.path(),
               r.error().message());
    return r;
  }

  auto cache = build_cache();
  if (!cache) {
    return std::unexpected(cache.error());
  }
  cache_ = std::move(*cache);
  factory_->set_instance(cache_);
  rate_limiter_ = std::make_unique<RateLimiter>(make_rate_limit_config(config_),
                                                *cache_, store_, *clock_);

  initialized_ = true;
  log::info("Store {} opened, cache backend {}", store_.path(),
            to_string_view(cache_->backend()));
  return ok();
}

auto Application::build_cache() -> Result<std::shared_ptr<Cache>> {
  factory_->set_environment({object_cache_, &store_, clock_});
  factory_->set_default_prefix(config_.cache.prefix);

  switch (config_.cache.backend) {
    case CacheBackendChoice::Auto:
      return factory_->create(config_.cache.prefix);
    case CacheBackendChoice::Transient: {
      auto r = factory_->create_transient_cache(config_.cache.prefix);
      if (!r) {
        return std::unexpected(r.error());
      }
      return std::shared_ptr<Cache>{std::move(*r)};
    }
    case CacheBackendChoice::Memory:
      return std::shared_ptr<Cache>{
          factory_->create_memory_cache(config_.cache.memory_max_items)};
    case CacheBackendChoice::Null:
      return std::shared_ptr<Cache>{factory_->create_null_cache()};
  }
  return fail(Error::InvalidArgument);
}

auto Application::register_task(std::unique_ptr<MaintenanceTask> task)
    -> Result<void> {
  return runner_.register_task(std::move(task));
}

auto Application::tick() -> std::size_t {
  std::size_t ran = 0;
  for (const auto& task_id : host_.pop_due(clock_->now())) {
    auto result = runner_.run(task_id);
    if (result) {
      ++ran;
      continue;
    }
    if (result.error() == make_error_code(Error::NotFound)) {
      // Keep the recurrence alive so the task runs once it is registered.
      log::warn("No implementation registered for {}", task_id);
      if (!scheduling_.schedule_next(task_id)) {
        log::debug("No recurring run queued for {}", task_id);
      }
    } else {
      log::error("Failed to run {}: {}", task_id, result.error().message());
    }
  }
  return ran;
}

auto Application::run(const std::atomic<bool>& stop) -> void {
  const auto interval = std::chrono::milliseconds{
      std::max(config_.runner.tick_interval_ms, 1)};
  constexpr auto kPoll = std::chrono::milliseconds{100};

  while (!stop.load(std::memory_order_acquire)) {
    tick();
    auto waited = std::chrono::milliseconds{0};
    while (waited < interval && !stop.load(std::memory_order_acquire)) {
      auto step = std::min(kPoll, interval - waited);
      std::this_thread::sleep_for(step);
      waited += step;
    }
  }
}

}  // namespace upkeep
