#pragma once

#include "upkeep/util/clock.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace upkeep {

using ErrorMap = std::map<std::string, std::string>;
using Elapsed = std::chrono::duration<double>;

// Fields to replace in TaskResult::with(). Unset fields keep their value.
// The timestamps take an inner std::nullopt to clear the stored value.
struct TaskResultPatch {
  std::optional<bool> success;
  std::optional<std::int64_t> items_found;
  std::optional<std::int64_t> items_cleaned;
  std::optional<std::int64_t> bytes_freed;
  std::optional<ErrorMap> errors;
  std::optional<bool> interrupted;
  std::optional<std::optional<TimePoint>> next_run;
  std::optional<std::string> task_id;
  std::optional<std::optional<TimePoint>> executed_at;
  std::optional<Elapsed> elapsed_time;
};

// Outcome of one execution slice of one task. Immutable: every modifier
// returns a new instance.
class TaskResult {
public:
  TaskResult() = default;

  [[nodiscard]] static auto success(std::string task_id,
                                    std::int64_t items_found = 0,
                                    std::int64_t items_cleaned = 0,
                                    std::int64_t bytes_freed = 0,
                                    Elapsed elapsed = Elapsed{0}) -> TaskResult;
  [[nodiscard]] static auto failure(std::string task_id, ErrorMap errors = {},
                                    Elapsed elapsed = Elapsed{0}) -> TaskResult;
  // success = true, interrupted = true. `next_run` is when the remaining
  // work should resume.
  [[nodiscard]] static auto interrupted(
      std::string task_id, std::int64_t items_found = 0,
      std::int64_t items_cleaned = 0, std::int64_t bytes_freed = 0,
      ErrorMap errors = {}, std::optional<TimePoint> next_run = std::nullopt,
      Elapsed elapsed = Elapsed{0}) -> TaskResult;

  [[nodiscard]] auto with(const TaskResultPatch& patch) const -> TaskResult;
  [[nodiscard]] auto add_counts(std::int64_t found = 0, std::int64_t cleaned = 0,
                                std::int64_t bytes = 0) const -> TaskResult;
  [[nodiscard]] auto add_error(std::string key, std::string message) const
      -> TaskResult;

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return success_;
  }
  [[nodiscard]] auto items_found() const noexcept -> std::int64_t {
    return items_found_;
  }
  [[nodiscard]] auto items_cleaned() const noexcept -> std::int64_t {
    return items_cleaned_;
  }
  [[nodiscard]] auto bytes_freed() const noexcept -> std::int64_t {
    return bytes_freed_;
  }
  [[nodiscard]] auto errors() const noexcept -> const ErrorMap& {
    return errors_;
  }
  [[nodiscard]] auto has_errors() const noexcept -> bool {
    return !errors_.empty();
  }
  [[nodiscard]] auto is_interrupted() const noexcept -> bool {
    return interrupted_;
  }
  [[nodiscard]] auto next_run() const noexcept -> std::optional<TimePoint> {
    return next_run_;
  }
  [[nodiscard]] auto task_id() const noexcept -> const std::string& {
    return task_id_;
  }
  [[nodiscard]] auto executed_at() const noexcept -> std::optional<TimePoint> {
    return executed_at_;
  }
  [[nodiscard]] auto elapsed_time() const noexcept -> Elapsed {
    return elapsed_time_;
  }

  // Emits `interrupted` and its older name `was_interrupted`.
  [[nodiscard]] auto to_json() const -> nlohmann::json;
  // Accepts either interrupted key. A record without `items_found` takes it
  // from `items_cleaned`. Malformed fields read as their defaults.
  [[nodiscard]] static auto from_json(const nlohmann::json& data) -> TaskResult;

  auto operator==(const TaskResult&) const -> bool = default;

private:
  bool success_{true};
  std::int64_t items_found_{0};
  std::int64_t items_cleaned_{0};
  std::int64_t bytes_freed_{0};
  ErrorMap errors_;
  bool interrupted_{false};
  std::optional<TimePoint> next_run_;
  std::string task_id_;
  std::optional<TimePoint> executed_at_;
  Elapsed elapsed_time_{0};
};

}  // namespace upkeep
