#include "upkeep/task/task_runner.hpp"

#include "upkeep/util/log.hpp"
#include "upkeep/util/time.hpp"

#include <exception>

namespace upkeep {

TaskRunner::TaskRunner(KvStore& store, HostScheduler& host,
                       SchedulingService& scheduling, const Clock& clock,
                       RunnerOptions options)
    : store_(&store), host_(&host), scheduling_(&scheduling), clock_(&clock),
      options_(options) {
}

auto TaskRunner::register_task(std::unique_ptr<MaintenanceTask> task)
    -> Result<void> {
  if (!task || task->id().empty()) {
    return fail(Error::InvalidArgument);
  }
  std::string id{task->id()};
  if (tasks_.contains(id)) {
    log::warn("Task {} is already registered", id);
    return fail(Error::InvalidArgument);
  }
  log::debug("Registered task {} ({})", id, task->name());
  tasks_.emplace(std::move(id), std::move(task));
  return ok();
}

auto TaskRunner::has_task(std::string_view task_id) const -> bool {
  return tasks_.find(task_id) != tasks_.end();
}

auto TaskRunner::task_ids() const -> std::vector<std::string> {
  std::vector<std::string> ids;
  ids.reserve(tasks_.size());
  for (const auto& [id, _] : tasks_) {
    ids.push_back(id);
  }
  return ids;
}

auto TaskRunner::run(std::string_view task_id) -> Result<TaskResult> {
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    log::warn("Unknown task {}", task_id);
    return fail(Error::NotFound);
  }
  auto& task = *it->second;

  ExecutionContext ctx{std::string{task_id},
                       ProgressStore::for_task(*store_, task_id, *clock_),
                       *clock_, options_.budget};
  if (ctx.progress().has_progress()) {
    log::info("Resuming {} from checkpoint", task_id);
  } else {
    log::info("Starting {}", task_id);
  }

  TaskResult result;
  try {
    result = task.execute(ctx);
  } catch (const std::exception& e) {
    log::error("Task {} threw: {}", task_id, e.what());
    result = ctx.make_failure({{"exception", e.what()}});
  }

  TaskResultPatch stamp;
  if (result.task_id().empty()) {
    stamp.task_id = std::string{task_id};
  }
  if (!result.executed_at()) {
    stamp.executed_at = util::whole_seconds(clock_->now());
  }
  result = result.with(stamp);

  after_slice(result, ctx.progress());
  return result;
}

auto TaskRunner::after_slice(const TaskResult& result, ProgressStore& progress)
    -> void {
  const auto& task_id = result.task_id();

  if (result.is_interrupted()) {
    if (!progress.has_progress()) {
      log::warn("{} was interrupted without a checkpoint, it will restart",
                task_id);
    }
    auto at = result.next_run().value_or(
        util::whole_seconds(clock_->now() + options_.resume_delay));
    if (!host_->schedule(task_id, at)) {
      log::error("Failed to queue resumption of {}", task_id);
      return;
    }
    log::info("{} interrupted after {:.2f}s ({} of {} items), resuming at {}",
              task_id, result.elapsed_time().count(), result.items_cleaned(),
              result.items_found(), util::format_datetime(at));
    return;
  }

  if (result.is_success()) {
    if (progress.has_progress() && !progress.clear()) {
      log::warn("Failed to clear checkpoint of {}", task_id);
    }
    log::info("{} completed in {:.2f}s: {} found, {} cleaned, {} bytes freed",
              task_id, result.elapsed_time().count(), result.items_found(),
              result.items_cleaned(), result.bytes_freed());
  } else {
    for (const auto& [key, message] : result.errors()) {
      log::error("{} failed [{}]: {}", task_id, key, message);
    }
  }

  if (!scheduling_->schedule_next(task_id)) {
    log::debug("No recurring run queued for {}", task_id);
  }
}

auto TaskRunner::reset_progress(std::string_view task_id) -> bool {
  auto progress = ProgressStore::for_task(*store_, task_id, *clock_);
  log::info("Resetting progress of {}", task_id);
  return progress.clear();
}

}  // namespace upkeep
