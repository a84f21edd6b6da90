#pragma once

#include "upkeep/scheduler/progress_store.hpp"
#include "upkeep/scheduler/task_result.hpp"
#include "upkeep/util/clock.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <string_view>

namespace upkeep {

struct TimeBudget {
  std::chrono::seconds time_limit{25};
  // Reserved at the end of the slice for saving a checkpoint.
  std::chrono::seconds time_buffer{3};
  std::chrono::seconds minimum{5};
};

// Everything one execution slice needs: its checkpoint, its time budget
// and helpers to build results stamped with the elapsed time.
class ExecutionContext {
public:
  ExecutionContext(std::string task_id, ProgressStore progress,
                   const Clock& clock = system_clock(), TimeBudget budget = {})
      : task_id_(std::move(task_id)), progress_(std::move(progress)),
        clock_(&clock), budget_(budget),
        time_limit_(std::max(budget.time_limit, budget.minimum)),
        started_(clock.now()) {
  }

  [[nodiscard]] auto task_id() const noexcept -> const std::string& {
    return task_id_;
  }
  [[nodiscard]] auto progress() noexcept -> ProgressStore& {
    return progress_;
  }
  [[nodiscard]] auto clock() const noexcept -> const Clock& {
    return *clock_;
  }
  [[nodiscard]] auto time_limit() const noexcept -> std::chrono::seconds {
    return time_limit_;
  }

  [[nodiscard]] auto elapsed() const -> Elapsed {
    return std::chrono::duration_cast<Elapsed>(clock_->now() - started_);
  }

  // Time left before the slice should stop, excluding the buffer.
  [[nodiscard]] auto remaining() const -> Elapsed {
    auto left = Elapsed{time_limit_ - budget_.time_buffer} - elapsed();
    return std::max(left, Elapsed{0});
  }

  [[nodiscard]] auto is_time_limit_approaching() const -> bool {
    return elapsed() >= Elapsed{time_limit_ - budget_.time_buffer};
  }

  [[nodiscard]] auto make_success(std::int64_t items_found = 0,
                                  std::int64_t items_cleaned = 0,
                                  std::int64_t bytes_freed = 0) const
      -> TaskResult {
    return TaskResult::success(task_id_, items_found, items_cleaned,
                               bytes_freed, elapsed());
  }

  [[nodiscard]] auto make_failure(ErrorMap errors = {}) const -> TaskResult {
    return TaskResult::failure(task_id_, std::move(errors), elapsed());
  }

  [[nodiscard]] auto make_interrupted(
      std::int64_t items_found = 0, std::int64_t items_cleaned = 0,
      std::int64_t bytes_freed = 0, ErrorMap errors = {},
      std::optional<TimePoint> next_run = std::nullopt) const -> TaskResult {
    return TaskResult::interrupted(task_id_, items_found, items_cleaned,
                                   bytes_freed, std::move(errors), next_run,
                                   elapsed());
  }

private:
  std::string task_id_;
  ProgressStore progress_;
  const Clock* clock_;
  TimeBudget budget_;
  std::chrono::seconds time_limit_;
  TimePoint started_;
};

// A maintenance job. execute() runs one bounded slice: it resumes from the
// context's checkpoint, and when it runs out of budget it saves a new
// checkpoint and returns an interrupted result.
class MaintenanceTask {
public:
  virtual ~MaintenanceTask() = default;

  [[nodiscard]] virtual auto id() const -> std::string_view = 0;
  [[nodiscard]] virtual auto name() const -> std::string_view = 0;
  [[nodiscard]] virtual auto description() const -> std::string_view {
    return {};
  }

  virtual auto execute(ExecutionContext& ctx) -> TaskResult = 0;
};

}  // namespace upkeep
