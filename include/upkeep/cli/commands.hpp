#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace upkeep::cli {

// An empty config_file means built-in defaults.

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  bool daemon{false};
};

struct ScheduleOptions {
  std::string config_file;
};

struct ReconcileOptions {
  std::string config_file;
};

struct StatusOptions {
  std::string config_file;
};

enum class ProgressAction : std::uint8_t { List, Clear, Prune };

struct ProgressOptions {
  std::string config_file;
  ProgressAction action{ProgressAction::List};
  // Clear: a single task, or every checkpoint when empty.
  std::string task_id;
  // Prune: checkpoints older than this are removed.
  std::int64_t max_age_sec{86400};
};

struct ValidateOptions {
  std::string config_file;
  bool print{false};
};

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_schedule(const ScheduleOptions& opts) -> int;
[[nodiscard]] auto cmd_reconcile(const ReconcileOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_progress(const ProgressOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace upkeep::cli
