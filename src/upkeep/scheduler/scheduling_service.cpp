#include "upkeep/scheduler/scheduling_service.hpp"

#include "upkeep/scheduler/progress_store.hpp"
#include "upkeep/util/log.hpp"
#include "upkeep/util/time.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace upkeep {

namespace {

auto resolve_zone(const std::string& name) -> const std::chrono::time_zone* {
  try {
    return std::chrono::locate_zone(name);
  } catch (const std::runtime_error& e) {
    log::warn("Unknown time zone '{}', using UTC: {}", name, e.what());
    return nullptr;
  }
}

auto next_hour_after(TimePoint now, int hour, const std::chrono::time_zone* tz)
    -> TimePoint {
  using namespace std::chrono;
  if (!tz) {
    auto midnight = floor<days>(now);
    TimePoint at = midnight + hours{hour};
    return at <= now ? at + days{1} : at;
  }
  auto local_midnight = floor<days>(tz->to_local(now));
  auto candidate = local_midnight + hours{hour};
  TimePoint at = tz->to_sys(candidate, choose::earliest);
  if (at <= now) {
    at = tz->to_sys(candidate + days{1}, choose::earliest);
  }
  return at;
}

}  // namespace

SchedulingService::SchedulingService(SchedulingSettings settings,
                                     HostScheduler& host, KvStore& store,
                                     const Clock& clock,
                                     std::chrono::seconds stale_threshold)
    : settings_(std::move(settings)), host_(&host), store_(&store),
      clock_(&clock), stale_threshold_(stale_threshold) {
}

auto SchedulingService::set_settings(SchedulingSettings settings) -> void {
  settings_ = std::move(settings);
}

auto SchedulingService::frequency_key(std::string_view task_id)
    -> std::string {
  std::string key{kFrequencyKeyPrefix};
  key.append(task_id);
  return key;
}

auto SchedulingService::get_known_task_ids() const
    -> std::vector<std::string> {
  std::vector<std::string> ids;
  ids.reserve(kTaskRegistry.size());
  for (const auto& entry : kTaskRegistry) {
    ids.emplace_back(entry.task_id);
  }
  return ids;
}

auto SchedulingService::get_task_config(std::string_view task_id) const
    -> std::optional<TaskRegistryEntry> {
  if (const auto* entry = find_task_entry(task_id)) {
    return *entry;
  }
  return std::nullopt;
}

auto SchedulingService::calculate_next_run_time(
    std::optional<int> preferred_hour) const -> TimePoint {
  int hour = std::clamp(preferred_hour.value_or(settings_.preferred_time), 0,
                        23);
  return next_hour_after(clock_->now(), hour, resolve_zone(settings_.timezone));
}

auto SchedulingService::desired_frequency(const TaskRegistryEntry& entry) const
    -> std::string {
  return settings_.frequency_for(entry.frequency_key,
                                 to_string_view(entry.default_frequency));
}

auto SchedulingService::wants_schedule(const TaskRegistryEntry& entry) const
    -> bool {
  return settings_.is_task_enabled(entry.enabled_key) &&
         desired_frequency(entry) != kFrequencyDisabled;
}

auto SchedulingService::schedule(std::string_view task_id,
                                 std::string_view frequency,
                                 std::optional<TimePoint> next_run) -> bool {
  if (frequency == kFrequencyDisabled) {
    return unschedule(task_id);
  }
  if (!parse_frequency(frequency)) {
    log::warn("Cannot schedule {}: invalid frequency '{}'", task_id,
              frequency);
    return false;
  }

  // The host replaces any pending run, so a rejected call leaves it intact.
  auto at = next_run.value_or(calculate_next_run_time());
  if (!host_->schedule(task_id, at)) {
    log::error("Host scheduler rejected {} at {}", task_id,
               util::format_datetime(at));
    return false;
  }
  if (auto r = store_->put(frequency_key(task_id), frequency); !r) {
    log::warn("Failed to record frequency of {}: {}", task_id,
              r.error().message());
  }

  log::info("Scheduled {} ({}) at {}", task_id, frequency,
            util::format_datetime(at));
  return true;
}

auto SchedulingService::reschedule(std::string_view task_id,
                                   std::string_view frequency,
                                   std::optional<TimePoint> next_run) -> bool {
  if (!unschedule(task_id)) {
    return false;
  }
  if (frequency == kFrequencyDisabled) {
    return true;
  }
  return schedule(task_id, frequency, next_run);
}

auto SchedulingService::unschedule(std::string_view task_id) -> bool {
  if (!host_->unschedule(task_id)) {
    log::error("Failed to unschedule {}", task_id);
    return false;
  }
  if (auto r = store_->remove(frequency_key(task_id)); !r) {
    log::warn("Failed to drop frequency of {}: {}", task_id,
              r.error().message());
  }
  log::info("Unscheduled {}", task_id);
  return true;
}

auto SchedulingService::unschedule_all() -> std::size_t {
  std::size_t count = 0;
  for (const auto& entry : kTaskRegistry) {
    if (unschedule(entry.task_id)) {
      ++count;
    }
  }
  return count;
}

auto SchedulingService::get_next_run(std::string_view task_id)
    -> std::optional<TimePoint> {
  return host_->next_scheduled(task_id);
}

auto SchedulingService::is_scheduled(std::string_view task_id) -> bool {
  return host_->is_scheduled(task_id);
}

auto SchedulingService::get_frequency(std::string_view task_id)
    -> std::optional<std::string> {
  auto stored = store_->get(frequency_key(task_id));
  if (!stored) {
    log::warn("Failed to read frequency of {}: {}", task_id,
              stored.error().message());
    return std::nullopt;
  }
  return *stored;
}

auto SchedulingService::schedule_initial_tasks() -> InitialScheduleResult {
  InitialScheduleResult result;

  if (!settings_.scheduler_enabled) {
    result.skipped = get_known_task_ids();
    log::info("Scheduler disabled, skipped {} task(s)", result.skipped.size());
    return result;
  }

  auto next_run = calculate_next_run_time();
  for (const auto& entry : kTaskRegistry) {
    std::string task_id{entry.task_id};
    if (!wants_schedule(entry)) {
      result.skipped.push_back(std::move(task_id));
      continue;
    }
    auto frequency = desired_frequency(entry);
    if (!parse_frequency(frequency)) {
      result.errors.emplace(task_id,
                            std::format("Invalid frequency '{}'", frequency));
      continue;
    }
    if (schedule(task_id, frequency, next_run)) {
      result.scheduled.push_back(std::move(task_id));
    } else {
      result.errors.emplace(std::move(task_id), "Failed to schedule");
    }
  }
  return result;
}

auto SchedulingService::reconcile_task(const TaskRegistryEntry& entry,
                                       TimePoint next_run,
                                       ReconcileResult& result) -> void {
  std::string task_id{entry.task_id};
  bool scheduled = is_scheduled(task_id);

  if (!wants_schedule(entry)) {
    if (!scheduled) {
      result.unchanged.push_back(std::move(task_id));
    } else if (unschedule(task_id)) {
      result.unscheduled.push_back(std::move(task_id));
    } else {
      result.errors.emplace(std::move(task_id), "Failed to unschedule");
    }
    return;
  }

  auto desired = desired_frequency(entry);
  if (!parse_frequency(desired)) {
    result.errors.emplace(std::move(task_id),
                          std::format("Invalid frequency '{}'", desired));
    return;
  }

  if (!scheduled) {
    if (schedule(task_id, desired, next_run)) {
      result.scheduled.push_back(std::move(task_id));
    } else {
      result.errors.emplace(std::move(task_id), "Failed to schedule");
    }
    return;
  }

  if (get_frequency(task_id) != desired) {
    if (reschedule(task_id, desired, next_run)) {
      result.rescheduled.push_back(std::move(task_id));
    } else {
      result.errors.emplace(std::move(task_id), "Failed to reschedule");
    }
    return;
  }

  result.unchanged.push_back(std::move(task_id));
}

auto SchedulingService::clear_stale_progress(ReconcileResult& result) -> void {
  ProgressStore sweeper{*store_, {}, *clock_};
  for (const auto& [task_id, data] : sweeper.load_all()) {
    auto progress = ProgressStore::for_task(*store_, task_id, *clock_);
    if (!progress.is_stale(stale_threshold_)) {
      continue;
    }
    if (progress.clear()) {
      log::warn("Cleared abandoned checkpoint of {}", task_id);
      result.stale_cleared.push_back(task_id);
    }
  }
}

auto SchedulingService::reconcile() -> ReconcileResult {
  ReconcileResult result;
  clear_stale_progress(result);

  if (!settings_.scheduler_enabled) {
    for (const auto& entry : kTaskRegistry) {
      std::string task_id{entry.task_id};
      if (!is_scheduled(task_id)) {
        continue;
      }
      if (unschedule(task_id)) {
        result.unscheduled.push_back(std::move(task_id));
      } else {
        result.errors.emplace(std::move(task_id), "Failed to unschedule");
      }
    }
    return result;
  }

  auto next_run = calculate_next_run_time();
  for (const auto& entry : kTaskRegistry) {
    reconcile_task(entry, next_run, result);
  }

  log::info(
      "Reconciled schedules: {} scheduled, {} unscheduled, {} rescheduled, "
      "{} unchanged, {} error(s)",
      result.scheduled.size(), result.unscheduled.size(),
      result.rescheduled.size(), result.unchanged.size(),
      result.errors.size());
  return result;
}

auto SchedulingService::get_status()
    -> std::map<std::string, TaskScheduleStatus> {
  std::map<std::string, TaskScheduleStatus> status;
  for (const auto& entry : kTaskRegistry) {
    std::string task_id{entry.task_id};
    auto next = get_next_run(task_id);
    status.emplace(task_id,
                   TaskScheduleStatus{
                       .scheduled = next.has_value(),
                       .next_run = next,
                       .frequency = get_frequency(task_id),
                       .enabled_in_settings =
                           settings_.is_task_enabled(entry.enabled_key),
                       .frequency_in_settings = desired_frequency(entry),
                   });
  }
  return status;
}

auto SchedulingService::schedule_next(std::string_view task_id) -> bool {
  const auto* entry = find_task_entry(task_id);
  if (!entry) {
    log::debug("{} is not a registry task, no recurring run", task_id);
    return false;
  }
  if (!settings_.scheduler_enabled || !wants_schedule(*entry)) {
    if (!unschedule(task_id)) {
      log::warn("Disabled task {} may still be queued", task_id);
    }
    return false;
  }

  auto desired = desired_frequency(*entry);
  auto frequency = parse_frequency(desired);
  if (!frequency) {
    log::warn("Cannot reschedule {}: invalid frequency '{}'", task_id, desired);
    return false;
  }
  auto at = calculate_next_run_time() +
            (interval_of(*frequency) - std::chrono::days{1});
  return schedule(task_id, desired, at);
}

auto SchedulingService::is_action_scheduler_available() const -> bool {
  return host_->supports_recurring();
}

}  // namespace upkeep
