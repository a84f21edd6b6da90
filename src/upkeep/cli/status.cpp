#include "common.hpp"
#include "upkeep/cli/commands.hpp"
#include "upkeep/util/time.hpp"

#include <print>

namespace upkeep::cli {

auto cmd_status(const StatusOptions& opts) -> int {
  auto app = open_application(opts.config_file);
  if (!app) {
    return 1;
  }

  const auto& settings = app->scheduling().settings();
  std::println("Scheduler: {}  preferred hour: {}  timezone: {}",
               settings.scheduler_enabled ? "enabled" : "disabled",
               settings.preferred_time, settings.timezone);
  std::println("Cache:     {}\n", to_string_view(app->cache().backend()));

  std::println("{:<20} {:<9} {:<10} {:<10} {:<20}", "TASK", "ENABLED",
               "SETTING", "APPLIED", "NEXT RUN");
  for (const auto& [task_id, s] : app->scheduling().get_status()) {
    std::string next = "-";
    if (s.next_run) {
      next = util::format_datetime(*s.next_run);
    }
    std::println("{:<20} {:<9} {:<10} {:<10} {:<20}", task_id,
                 s.enabled_in_settings ? "yes" : "no", s.frequency_in_settings,
                 s.frequency.value_or("-"), next);
  }
  return 0;
}

}  // namespace upkeep::cli
