#include "upkeep/scheduler/task_result.hpp"

#include "upkeep/util/time.hpp"

#include <algorithm>

namespace upkeep {

namespace {

auto read_bool(const nlohmann::json& data, const char* key)
    -> std::optional<bool> {
  auto it = data.find(key);
  if (it == data.end()) {
    return std::nullopt;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  if (it->is_number()) {
    return it->get<double>() != 0.0;
  }
  return std::nullopt;
}

auto read_count(const nlohmann::json& data, const char* key)
    -> std::optional<std::int64_t> {
  auto it = data.find(key);
  if (it == data.end() || !it->is_number()) {
    return std::nullopt;
  }
  return std::max<std::int64_t>(0, it->get<std::int64_t>());
}

auto read_errors(const nlohmann::json& data) -> ErrorMap {
  ErrorMap errors;
  auto it = data.find("errors");
  if (it == data.end() || !it->is_object()) {
    return errors;
  }
  for (const auto& [key, value] : it->items()) {
    errors.emplace(key, value.is_string() ? value.get<std::string>()
                                          : value.dump());
  }
  return errors;
}

auto read_timestamp(const nlohmann::json& data, const char* key)
    -> std::optional<TimePoint> {
  auto it = data.find(key);
  if (it == data.end()) {
    return std::nullopt;
  }
  return util::timestamp_from_json(*it);
}

}  // namespace

auto TaskResult::success(std::string task_id, std::int64_t items_found,
                         std::int64_t items_cleaned, std::int64_t bytes_freed,
                         Elapsed elapsed) -> TaskResult {
  TaskResult r;
  r.task_id_ = std::move(task_id);
  r.items_found_ = items_found;
  r.items_cleaned_ = items_cleaned;
  r.bytes_freed_ = bytes_freed;
  r.elapsed_time_ = elapsed;
  return r;
}

auto TaskResult::failure(std::string task_id, ErrorMap errors, Elapsed elapsed)
    -> TaskResult {
  TaskResult r;
  r.success_ = false;
  r.task_id_ = std::move(task_id);
  r.errors_ = std::move(errors);
  r.elapsed_time_ = elapsed;
  return r;
}

auto TaskResult::interrupted(std::string task_id, std::int64_t items_found,
                             std::int64_t items_cleaned,
                             std::int64_t bytes_freed, ErrorMap errors,
                             std::optional<TimePoint> next_run, Elapsed elapsed)
    -> TaskResult {
  TaskResult r;
  r.task_id_ = std::move(task_id);
  r.items_found_ = items_found;
  r.items_cleaned_ = items_cleaned;
  r.bytes_freed_ = bytes_freed;
  r.errors_ = std::move(errors);
  r.interrupted_ = true;
  r.next_run_ = next_run;
  r.elapsed_time_ = elapsed;
  return r;
}

auto TaskResult::with(const TaskResultPatch& patch) const -> TaskResult {
  TaskResult r = *this;
  if (patch.success) r.success_ = *patch.success;
  if (patch.items_found) r.items_found_ = *patch.items_found;
  if (patch.items_cleaned) r.items_cleaned_ = *patch.items_cleaned;
  if (patch.bytes_freed) r.bytes_freed_ = *patch.bytes_freed;
  if (patch.errors) r.errors_ = *patch.errors;
  if (patch.interrupted) r.interrupted_ = *patch.interrupted;
  if (patch.next_run) r.next_run_ = *patch.next_run;
  if (patch.task_id) r.task_id_ = *patch.task_id;
  if (patch.executed_at) r.executed_at_ = *patch.executed_at;
  if (patch.elapsed_time) r.elapsed_time_ = *patch.elapsed_time;
  return r;
}

auto TaskResult::add_counts(std::int64_t found, std::int64_t cleaned,
                            std::int64_t bytes) const -> TaskResult {
  return with({.items_found = items_found_ + found,
               .items_cleaned = items_cleaned_ + cleaned,
               .bytes_freed = bytes_freed_ + bytes});
}

auto TaskResult::add_error(std::string key, std::string message) const
    -> TaskResult {
  auto errors = errors_;
  errors.insert_or_assign(std::move(key), std::move(message));
  return with({.errors = std::move(errors)});
}

auto TaskResult::to_json() const -> nlohmann::json {
  return {
      {"success", success_},
      {"items_found", items_found_},
      {"items_cleaned", items_cleaned_},
      {"bytes_freed", bytes_freed_},
      {"errors", errors_},
      {"interrupted", interrupted_},
      {"was_interrupted", interrupted_},
      {"next_run", util::timestamp_to_json(next_run_)},
      {"task_id", task_id_},
      {"executed_at", util::timestamp_to_json(executed_at_)},
      {"elapsed_time", elapsed_time_.count()},
  };
}

auto TaskResult::from_json(const nlohmann::json& data) -> TaskResult {
  TaskResult r;
  if (!data.is_object()) {
    return r;
  }

  r.success_ = read_bool(data, "success").value_or(true);
  r.items_cleaned_ = read_count(data, "items_cleaned").value_or(0);
  r.items_found_ = read_count(data, "items_found").value_or(r.items_cleaned_);
  r.bytes_freed_ = read_count(data, "bytes_freed").value_or(0);
  r.errors_ = read_errors(data);

  auto interrupted = read_bool(data, "interrupted");
  if (!interrupted) {
    interrupted = read_bool(data, "was_interrupted");
  }
  r.interrupted_ = interrupted.value_or(false);

  r.next_run_ = read_timestamp(data, "next_run");
  r.executed_at_ = read_timestamp(data, "executed_at");

  if (auto it = data.find("task_id"); it != data.end() && it->is_string()) {
    r.task_id_ = it->get<std::string>();
  }
  if (auto it = data.find("elapsed_time"); it != data.end() && it->is_number()) {
    r.elapsed_time_ = Elapsed{std::max(0.0, it->get<double>())};
  }
  return r;
}

}  // namespace upkeep
