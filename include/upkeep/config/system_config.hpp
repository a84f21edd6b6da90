#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace upkeep {

struct StorageConfig {
  std::string db_file{"upkeep.db"};
};

struct RunnerConfig {
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
  int tick_interval_ms{1000};
  int time_limit_sec{25};
  int time_buffer_sec{3};
  int resume_delay_sec{60};
  int stale_threshold_sec{86400};
};

// Scheduler settings. Per-task flags and frequencies are keyed by the
// registry's setting keys; a missing entry means "use the default".
struct SchedulingSettings {
  bool scheduler_enabled{true};
  int preferred_time{2};
  std::string timezone{"UTC"};
  std::map<std::string, bool, std::less<>> task_enabled;
  std::map<std::string, std::string, std::less<>> task_frequency;

  [[nodiscard]] auto is_task_enabled(std::string_view enabled_key) const
      -> bool {
    auto it = task_enabled.find(enabled_key);
    return it == task_enabled.end() || it->second;
  }

  [[nodiscard]] auto frequency_for(std::string_view frequency_key,
                                   std::string_view fallback) const
      -> std::string {
    auto it = task_frequency.find(frequency_key);
    return it == task_frequency.end() ? std::string{fallback} : it->second;
  }
};

enum class CacheBackendChoice : std::uint8_t { Auto, Transient, Memory, Null };

[[nodiscard]] constexpr auto cache_backend_choice_to_string(
    CacheBackendChoice choice) noexcept -> std::string_view {
  switch (choice) {
    case CacheBackendChoice::Auto: return "auto";
    case CacheBackendChoice::Transient: return "transient";
    case CacheBackendChoice::Memory: return "memory";
    case CacheBackendChoice::Null: return "null";
  }
  return "auto";
}

[[nodiscard]] inline auto string_to_cache_backend_choice(
    std::string_view str) noexcept -> CacheBackendChoice {
  if (str == "transient") return CacheBackendChoice::Transient;
  if (str == "memory") return CacheBackendChoice::Memory;
  if (str == "null") return CacheBackendChoice::Null;
  return CacheBackendChoice::Auto;
}

struct CacheConfig {
  CacheBackendChoice backend{CacheBackendChoice::Auto};
  std::string prefix{"upkeep_"};
  std::size_t memory_max_items{1000};
};

struct RateLimitSection {
  int requests_per_minute{60};
  int lock_attempts{5};
  int lock_backoff_ms{50};
  int lock_ttl_sec{5};
};

struct SystemConfig {
  StorageConfig storage;
  RunnerConfig runner;
  SchedulingSettings scheduling;
  CacheConfig cache;
  RateLimitSection rate_limit;
};

}  // namespace upkeep
