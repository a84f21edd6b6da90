#pragma once

#include "upkeep/core/error.hpp"
#include "upkeep/scheduler/host_scheduler.hpp"
#include "upkeep/scheduler/scheduling_service.hpp"
#include "upkeep/storage/kv_store.hpp"
#include "upkeep/task/maintenance_task.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace upkeep {

struct RunnerOptions {
  TimeBudget budget;
  // Used when an interrupted result carries no next_run.
  std::chrono::seconds resume_delay{60};
};

// Runs one slice of a registered task and acts on its result: an
// interrupted slice keeps its checkpoint and is queued again, a completed
// slice drops its checkpoint and gets its next recurring run. A failed
// slice keeps its checkpoint for the next regular run.
class TaskRunner {
public:
  TaskRunner(KvStore& store, HostScheduler& host,
             SchedulingService& scheduling, const Clock& clock = system_clock(),
             RunnerOptions options = {});

  TaskRunner(const TaskRunner&) = delete;
  auto operator=(const TaskRunner&) -> TaskRunner& = delete;

  // Error::InvalidArgument for a null task, an empty id or a duplicate id.
  [[nodiscard]] auto register_task(std::unique_ptr<MaintenanceTask> task)
      -> Result<void>;
  [[nodiscard]] auto has_task(std::string_view task_id) const -> bool;
  [[nodiscard]] auto task_ids() const -> std::vector<std::string>;

  // Error::NotFound for an unregistered task. Exceptions thrown by the task
  // become a failed result.
  [[nodiscard]] auto run(std::string_view task_id) -> Result<TaskResult>;

  auto reset_progress(std::string_view task_id) -> bool;

  [[nodiscard]] auto options() const noexcept -> const RunnerOptions& {
    return options_;
  }

private:
  auto after_slice(const TaskResult& result, ProgressStore& progress) -> void;

  KvStore* store_;
  HostScheduler* host_;
  SchedulingService* scheduling_;
  const Clock* clock_;
  RunnerOptions options_;
  std::map<std::string, std::unique_ptr<MaintenanceTask>, std::less<>> tasks_;
};

}  // namespace upkeep
