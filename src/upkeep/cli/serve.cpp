#include "common.hpp"
#include "upkeep/cli/commands.hpp"
#include "upkeep/util/daemon.hpp"
#include "upkeep/util/log.hpp"

#include <print>

namespace upkeep::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }

  const auto log_file = opts.log_file.value_or(config->runner.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config->runner.log_level);
  log::start();

  const auto pid_file = config->runner.pid_file;
  if (!write_pid_file(pid_file)) {
    log::error("Failed to write pid file {}", pid_file);
    log::stop();
    return 1;
  }

  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    remove_pid_file(pid_file);
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  // A fresh queue gets every task; an existing one keeps pending resumptions.
  if (app.host_scheduler().list_scheduled().empty()) {
    auto initial = app.scheduling().schedule_initial_tasks();
    log::info("Scheduled {} task(s), skipped {}", initial.scheduled.size(),
              initial.skipped.size());
    for (const auto& [task_id, message] : initial.errors) {
      log::warn("Could not schedule {}: {}", task_id, message);
    }
  } else {
    auto rec = app.scheduling().reconcile();
    log::info("Reconciled: {} scheduled, {} rescheduled, {} unscheduled, "
              "{} unchanged",
              rec.scheduled.size(), rec.rescheduled.size(),
              rec.unscheduled.size(), rec.unchanged.size());
    for (const auto& [task_id, message] : rec.errors) {
      log::warn("Could not schedule {}: {}", task_id, message);
    }
  }

  log::info("upkeep running, tick every {}ms", app.config().runner.tick_interval_ms);
  app.run(g_shutdown_requested);

  log::info("upkeep stopped.");
  remove_pid_file(pid_file);
  log::stop();
  return 0;
}

}  // namespace upkeep::cli
