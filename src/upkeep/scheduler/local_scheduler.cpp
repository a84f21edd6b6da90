#include "upkeep/scheduler/local_scheduler.hpp"

#include "upkeep/util/log.hpp"
#include "upkeep/util/time.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

namespace upkeep {

namespace {

auto parse_run_time(std::string_view raw) -> std::optional<TimePoint> {
  std::int64_t secs = 0;
  auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), secs);
  if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
    return std::nullopt;
  }
  return util::from_unix_seconds(secs);
}

}  // namespace

LocalScheduler::LocalScheduler(KvStore& store) : store_(&store) {
}

auto LocalScheduler::queue_key(std::string_view task_id) -> std::string {
  std::string key{kQueuePrefix};
  key.append(task_id);
  return key;
}

auto LocalScheduler::schedule(std::string_view task_id, TimePoint at) -> bool {
  auto r = store_->put(queue_key(task_id),
                       std::to_string(util::to_unix_seconds(at)));
  if (!r) {
    log::error("Failed to queue {}: {}", task_id, r.error().message());
    return false;
  }
  return true;
}

auto LocalScheduler::unschedule(std::string_view task_id) -> bool {
  auto r = store_->remove(queue_key(task_id));
  if (!r) {
    log::error("Failed to dequeue {}: {}", task_id, r.error().message());
    return false;
  }
  return true;
}

auto LocalScheduler::is_scheduled(std::string_view task_id) -> bool {
  return next_scheduled(task_id).has_value();
}

auto LocalScheduler::next_scheduled(std::string_view task_id)
    -> std::optional<TimePoint> {
  auto raw = store_->get(queue_key(task_id));
  if (!raw) {
    log::warn("Failed to read queue entry of {}: {}", task_id,
              raw.error().message());
    return std::nullopt;
  }
  if (!*raw) {
    return std::nullopt;
  }
  return parse_run_time(**raw);
}

auto LocalScheduler::list_scheduled() -> std::map<std::string, TimePoint> {
  std::map<std::string, TimePoint> out;
  auto rows = store_->scan_prefix(kQueuePrefix);
  if (!rows) {
    log::warn("Failed to list queue: {}", rows.error().message());
    return out;
  }
  for (const auto& [name, raw] : *rows) {
    if (auto at = parse_run_time(raw)) {
      out.emplace(name.substr(kQueuePrefix.size()), *at);
    }
  }
  return out;
}

auto LocalScheduler::pop_due(TimePoint now) -> std::vector<std::string> {
  std::vector<std::pair<TimePoint, std::string>> due;
  for (auto& [task_id, at] : list_scheduled()) {
    if (at <= now) {
      due.emplace_back(at, task_id);
    }
  }
  std::ranges::sort(due);

  std::vector<std::string> out;
  out.reserve(due.size());
  for (auto& [at, task_id] : due) {
    if (unschedule(task_id)) {
      out.push_back(std::move(task_id));
    }
  }
  return out;
}

}  // namespace upkeep
