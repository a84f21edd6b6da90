#include "common.hpp"
#include "upkeep/cli/commands.hpp"

#include <print>

namespace upkeep::cli {

namespace {

void print_list(std::string_view label, const std::vector<std::string>& ids) {
  if (ids.empty()) return;
  std::println("{:<12} {}", label, ids.size());
  for (const auto& id : ids) {
    std::println("  {}", id);
  }
}

void print_errors(const ErrorMap& errors) {
  for (const auto& [task_id, message] : errors) {
    std::println(stderr, "✗ {} - {}", task_id, message);
  }
}

}  // namespace

auto cmd_schedule(const ScheduleOptions& opts) -> int {
  auto app = open_application(opts.config_file);
  if (!app) {
    return 1;
  }

  auto result = app->scheduling().schedule_initial_tasks();
  print_list("Scheduled:", result.scheduled);
  print_list("Skipped:", result.skipped);
  print_errors(result.errors);
  return result.errors.empty() ? 0 : 1;
}

auto cmd_reconcile(const ReconcileOptions& opts) -> int {
  auto app = open_application(opts.config_file);
  if (!app) {
    return 1;
  }

  auto result = app->scheduling().reconcile();
  print_list("Scheduled:", result.scheduled);
  print_list("Rescheduled:", result.rescheduled);
  print_list("Unscheduled:", result.unscheduled);
  print_list("Unchanged:", result.unchanged);
  print_list("Stale:", result.stale_cleared);
  print_errors(result.errors);
  return result.errors.empty() ? 0 : 1;
}

}  // namespace upkeep::cli
