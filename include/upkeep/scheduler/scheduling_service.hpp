#pragma once

#include "upkeep/config/system_config.hpp"
#include "upkeep/scheduler/host_scheduler.hpp"
#include "upkeep/scheduler/task_registry.hpp"
#include "upkeep/scheduler/task_result.hpp"
#include "upkeep/storage/kv_store.hpp"
#include "upkeep/util/clock.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace upkeep {

struct InitialScheduleResult {
  std::vector<std::string> scheduled;
  std::vector<std::string> skipped;
  ErrorMap errors;
};

struct ReconcileResult {
  std::vector<std::string> scheduled;
  std::vector<std::string> unscheduled;
  std::vector<std::string> rescheduled;
  std::vector<std::string> unchanged;
  ErrorMap errors;
  // Task ids whose abandoned checkpoints were removed.
  std::vector<std::string> stale_cleared;
};

struct TaskScheduleStatus {
  bool scheduled{false};
  std::optional<TimePoint> next_run;
  std::optional<std::string> frequency;
  bool enabled_in_settings{true};
  std::string frequency_in_settings;
};

// Maps registry tasks to their settings, computes run times and keeps the
// host scheduler's queue in line with the settings.
//
// The host scheduler holds one pending run per task. The frequency a task
// was last scheduled with is kept in the store under
// `upkeep_schedule_freq_<task_id>` so drift in frequency can be detected.
class SchedulingService {
public:
  static constexpr std::string_view kFrequencyKeyPrefix =
      "upkeep_schedule_freq_";

  SchedulingService(SchedulingSettings settings, HostScheduler& host,
                    KvStore& store, const Clock& clock = system_clock(),
                    std::chrono::seconds stale_threshold =
                        std::chrono::seconds{86400});

  auto set_settings(SchedulingSettings settings) -> void;
  [[nodiscard]] auto settings() const noexcept -> const SchedulingSettings& {
    return settings_;
  }

  [[nodiscard]] auto get_known_task_ids() const -> std::vector<std::string>;
  [[nodiscard]] auto get_task_config(std::string_view task_id) const
      -> std::optional<TaskRegistryEntry>;

  // Next occurrence of `preferred_hour` (clamped to [0, 23]; defaults to the
  // configured preferred time) in the configured time zone, strictly after
  // now.
  [[nodiscard]] auto calculate_next_run_time(
      std::optional<int> preferred_hour = std::nullopt) const -> TimePoint;

  // "disabled" unschedules. An unknown frequency string fails.
  auto schedule(std::string_view task_id, std::string_view frequency,
                std::optional<TimePoint> next_run = std::nullopt) -> bool;
  auto reschedule(std::string_view task_id, std::string_view frequency,
                  std::optional<TimePoint> next_run = std::nullopt) -> bool;
  auto unschedule(std::string_view task_id) -> bool;
  auto unschedule_all() -> std::size_t;

  [[nodiscard]] auto get_next_run(std::string_view task_id)
      -> std::optional<TimePoint>;
  [[nodiscard]] auto is_scheduled(std::string_view task_id) -> bool;
  // Frequency the task was last scheduled with.
  [[nodiscard]] auto get_frequency(std::string_view task_id)
      -> std::optional<std::string>;

  [[nodiscard]] auto schedule_initial_tasks() -> InitialScheduleResult;
  [[nodiscard]] auto reconcile() -> ReconcileResult;
  [[nodiscard]] auto get_status() -> std::map<std::string, TaskScheduleStatus>;

  // Queues the next recurring run after a completed slice: the next
  // preferred-hour occurrence plus the frequency interval minus one day.
  // False when the task is unknown, disabled or cannot be scheduled.
  auto schedule_next(std::string_view task_id) -> bool;

  [[nodiscard]] auto is_action_scheduler_available() const -> bool;

private:
  [[nodiscard]] static auto frequency_key(std::string_view task_id)
      -> std::string;
  [[nodiscard]] auto desired_frequency(const TaskRegistryEntry& entry) const
      -> std::string;
  // Enable flag set and frequency not "disabled".
  [[nodiscard]] auto wants_schedule(const TaskRegistryEntry& entry) const
      -> bool;
  auto reconcile_task(const TaskRegistryEntry& entry, TimePoint next_run,
                      ReconcileResult& result) -> void;
  auto clear_stale_progress(ReconcileResult& result) -> void;

  SchedulingSettings settings_;
  HostScheduler* host_;
  KvStore* store_;
  const Clock* clock_;
  std::chrono::seconds stale_threshold_;
};

}  // namespace upkeep
