#pragma once

#include "upkeep/scheduler/host_scheduler.hpp"
#include "upkeep/storage/kv_store.hpp"

#include <vector>

namespace upkeep {

// HostScheduler backed by the durable store, so pending runs survive a
// restart. One `upkeep_queue_<task_id>` row per task holds its run time in
// epoch seconds. The application's tick loop drains due tasks with
// pop_due().
class LocalScheduler final : public HostScheduler {
public:
  static constexpr std::string_view kQueuePrefix = "upkeep_queue_";

  explicit LocalScheduler(KvStore& store);

  auto schedule(std::string_view task_id, TimePoint at) -> bool override;
  auto unschedule(std::string_view task_id) -> bool override;
  [[nodiscard]] auto is_scheduled(std::string_view task_id) -> bool override;
  [[nodiscard]] auto list_scheduled()
      -> std::map<std::string, TimePoint> override;
  [[nodiscard]] auto next_scheduled(std::string_view task_id)
      -> std::optional<TimePoint> override;

  // Removes and returns every task due at or before `now`, earliest first.
  [[nodiscard]] auto pop_due(TimePoint now) -> std::vector<std::string>;

private:
  [[nodiscard]] static auto queue_key(std::string_view task_id) -> std::string;

  KvStore* store_;
};

}  // namespace upkeep
