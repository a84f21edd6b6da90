#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace upkeep {

enum class Frequency : std::uint8_t {
  Daily,
  Weekly,
  Monthly,
};

// Frequency setting value meaning "do not schedule", independent of the
// task's enable flag.
inline constexpr std::string_view kFrequencyDisabled = "disabled";

[[nodiscard]] constexpr auto to_string_view(Frequency f) noexcept
    -> std::string_view {
  switch (f) {
    case Frequency::Daily: return "daily";
    case Frequency::Weekly: return "weekly";
    case Frequency::Monthly: return "monthly";
  }
  return "daily";
}

[[nodiscard]] constexpr auto parse_frequency(std::string_view s) noexcept
    -> std::optional<Frequency> {
  if (s == "daily") return Frequency::Daily;
  if (s == "weekly") return Frequency::Weekly;
  if (s == "monthly") return Frequency::Monthly;
  return std::nullopt;
}

[[nodiscard]] constexpr auto interval_of(Frequency f) noexcept
    -> std::chrono::days {
  switch (f) {
    case Frequency::Daily: return std::chrono::days{1};
    case Frequency::Weekly: return std::chrono::days{7};
    case Frequency::Monthly: return std::chrono::days{30};
  }
  return std::chrono::days{1};
}

struct TaskRegistryEntry {
  std::string_view task_id;
  std::string_view enabled_key;
  std::string_view frequency_key;
  Frequency default_frequency{Frequency::Weekly};

  auto operator==(const TaskRegistryEntry&) const -> bool = default;
};

inline constexpr std::array<TaskRegistryEntry, 3> kTaskRegistry{{
    {"database_cleanup", "enable_scheduled_db_cleanup",
     "database_cleanup_frequency", Frequency::Weekly},
    {"media_scan", "enable_scheduled_media_scan", "media_scan_frequency",
     Frequency::Weekly},
    {"performance_check", "enable_scheduled_performance_check",
     "performance_check_frequency", Frequency::Daily},
}};

[[nodiscard]] constexpr auto find_task_entry(std::string_view task_id) noexcept
    -> const TaskRegistryEntry* {
  auto it = std::ranges::find(kTaskRegistry, task_id,
                              &TaskRegistryEntry::task_id);
  return it != kTaskRegistry.end() ? &*it : nullptr;
}

}  // namespace upkeep
