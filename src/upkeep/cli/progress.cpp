#include "common.hpp"
#include "upkeep/cli/commands.hpp"
#include "upkeep/scheduler/progress_store.hpp"
#include "upkeep/util/time.hpp"

#include <print>

namespace upkeep::cli {

namespace {

auto list_progress(KvStore& store, ProgressStore& admin) -> int {
  auto all = admin.load_all();
  if (all.empty()) {
    std::println("No checkpoints.");
    return 0;
  }

  std::println("{:<20} {:<20} {:<12} {}", "TASK", "SAVED", "INTERRUPTED",
               "STALE");
  for (const auto& [task_id, _] : all) {
    auto progress = ProgressStore::for_task(store, task_id);
    std::string saved = "-";
    if (auto at = progress.saved_at()) {
      saved = util::format_datetime(*at);
    }
    std::println("{:<20} {:<20} {:<12} {}", task_id, saved,
                 progress.interrupted_at() ? "yes" : "no",
                 progress.is_stale(ProgressStore::kDefaultPruneAge) ? "yes" : "no");
  }

  auto stats = admin.statistics();
  std::println("\n{} checkpoint(s), {} stale, {} interrupted", stats.total,
               stats.stale, stats.interrupted);
  return 0;
}

}  // namespace

auto cmd_progress(const ProgressOptions& opts) -> int {
  auto app = open_application(opts.config_file);
  if (!app) {
    return 1;
  }
  ProgressStore admin(app->store());

  switch (opts.action) {
    case ProgressAction::List:
      return list_progress(app->store(), admin);
    case ProgressAction::Clear:
      if (opts.task_id.empty()) {
        std::println("Cleared {} checkpoint(s)", admin.clear_all());
        return 0;
      }
      if (!app->runner().reset_progress(opts.task_id)) {
        std::println("No checkpoint for {}", opts.task_id);
        return 0;
      }
      std::println("Cleared checkpoint of {}", opts.task_id);
      return 0;
    case ProgressAction::Prune: {
      auto removed = admin.prune_stale(std::chrono::seconds{opts.max_age_sec});
      std::println("Pruned {} checkpoint(s)", removed);
      return 0;
    }
  }
  return 1;
}

}  // namespace upkeep::cli
