#include "upkeep/scheduler/progress_store.hpp"

#include "upkeep/core/error.hpp"
#include "upkeep/util/log.hpp"
#include "upkeep/util/time.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace upkeep {

namespace {

// One mutex per checkpoint key, shared by every ProgressStore in the
// process. Entries live for the lifetime of the process.
auto key_mutex(const std::string& key) -> std::mutex& {
  static std::mutex registry_mu;
  static std::unordered_map<std::string, std::unique_ptr<std::mutex>,
                            StringHash, StringEqual>
      registry;

  std::lock_guard lock(registry_mu);
  auto it = registry.find(key);
  if (it == registry.end()) {
    it = registry.emplace(key, std::make_unique<std::mutex>()).first;
  }
  return *it->second;
}

auto parse_checkpoint(std::string_view raw) -> ProgressData {
  auto parsed = nlohmann::json::parse(raw, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return ProgressData::object();
  }
  return parsed;
}

auto saved_at_of(const ProgressData& data) -> std::optional<TimePoint> {
  auto it = data.find("saved_at");
  if (it == data.end()) {
    return std::nullopt;
  }
  return util::timestamp_from_json(*it);
}

}  // namespace

ProgressStore::ProgressStore(KvStore& store, std::string key,
                             const Clock& clock)
    : store_(&store), key_(std::move(key)), clock_(&clock) {
}

auto ProgressStore::for_task(KvStore& store, std::string_view task_id,
                             const Clock& clock) -> ProgressStore {
  return ProgressStore{store, key_for(task_id), clock};
}

auto ProgressStore::key_for(std::string_view task_id) -> std::string {
  std::string key{kKeyPrefix};
  key.append(task_id);
  return key;
}

auto ProgressStore::read() const -> ProgressData {
  if (!is_bound()) {
    return ProgressData::object();
  }
  auto raw = store_->get(key_);
  if (!raw) {
    log::warn("Failed to load checkpoint {}: {}", key_, raw.error().message());
    return ProgressData::object();
  }
  if (!*raw) {
    return ProgressData::object();
  }
  return parse_checkpoint(**raw);
}

auto ProgressStore::write(ProgressData data) -> bool {
  if (!is_bound()) {
    return false;
  }
  if (!data.is_object()) {
    log::warn("Refusing to save non-object checkpoint {}", key_);
    return false;
  }
  data["saved_at"] = util::to_unix_seconds(clock_->now());
  if (auto r = store_->put(key_, data.dump()); !r) {
    log::error("Failed to save checkpoint {}: {}", key_, r.error().message());
    return false;
  }
  return true;
}

template <typename Fn>
auto ProgressStore::modify(Fn&& fn) -> bool {
  if (!is_bound()) {
    return false;
  }
  std::lock_guard lock(key_mutex(key_));
  auto data = read();
  fn(data);
  return write(std::move(data));
}

auto ProgressStore::load() const -> ProgressData {
  return read();
}

auto ProgressStore::save(ProgressData data) -> bool {
  if (!is_bound()) {
    return false;
  }
  std::lock_guard lock(key_mutex(key_));
  return write(std::move(data));
}

auto ProgressStore::save_interrupted(ProgressData data, const ErrorMap& errors)
    -> bool {
  if (!data.is_object()) {
    return false;
  }
  data["interrupted_at"] = util::to_unix_seconds(clock_->now());
  if (!errors.empty()) {
    auto& stored = data["errors"];
    if (!stored.is_object()) {
      stored = nlohmann::json::object();
    }
    for (const auto& [k, v] : errors) {
      stored[k] = v;
    }
  }
  return save(std::move(data));
}

auto ProgressStore::update(const ProgressData& partial) -> bool {
  if (!partial.is_object()) {
    return false;
  }
  return modify([&](ProgressData& data) { data.update(partial); });
}

auto ProgressStore::add_completed_task(std::string_view name) -> bool {
  return modify([&](ProgressData& data) {
    auto& tasks = data["completed_tasks"];
    if (!tasks.is_array()) {
      tasks = nlohmann::json::array();
    }
    auto exists = std::any_of(tasks.begin(), tasks.end(),
                               [&](const nlohmann::json& t) {
      return t.is_string() && t.get_ref<const std::string&>() == name;
    });
    if (!exists) {
      tasks.push_back(std::string{name});
    }
  });
}

auto ProgressStore::add_error(std::string_view key, std::string_view message)
    -> bool {
  return modify([&](ProgressData& data) {
    auto& errors = data["errors"];
    if (!errors.is_object()) {
      errors = nlohmann::json::object();
    }
    errors[std::string{key}] = std::string{message};
  });
}

auto ProgressStore::increment(std::string_view counter, std::int64_t delta)
    -> bool {
  return modify([&](ProgressData& data) {
    auto& value = data[std::string{counter}];
    std::int64_t current = value.is_number() ? value.get<std::int64_t>() : 0;
    value = current + delta;
  });
}

auto ProgressStore::has_progress() const -> bool {
  return !read().empty();
}

auto ProgressStore::is_stale(std::chrono::seconds threshold) const -> bool {
  auto saved = saved_at();
  if (!saved) {
    return true;
  }
  return clock_->now() - *saved > threshold;
}

auto ProgressStore::clear() -> bool {
  if (!is_bound()) {
    return false;
  }
  std::lock_guard lock(key_mutex(key_));
  auto removed = store_->remove(key_);
  if (!removed) {
    log::error("Failed to clear checkpoint {}: {}", key_,
               removed.error().message());
    return false;
  }
  return *removed;
}

auto ProgressStore::saved_at() const -> std::optional<TimePoint> {
  return saved_at_of(read());
}

auto ProgressStore::interrupted_at() const -> std::optional<TimePoint> {
  auto data = read();
  auto it = data.find("interrupted_at");
  if (it == data.end()) {
    return std::nullopt;
  }
  return util::timestamp_from_json(*it);
}

auto ProgressStore::completed_tasks() const -> std::vector<std::string> {
  std::vector<std::string> out;
  auto data = read();
  auto it = data.find("completed_tasks");
  if (it == data.end() || !it->is_array()) {
    return out;
  }
  for (const auto& t : *it) {
    if (t.is_string()) {
      out.push_back(t.get<std::string>());
    }
  }
  return out;
}

auto ProgressStore::errors() const -> ErrorMap {
  ErrorMap out;
  auto data = read();
  auto it = data.find("errors");
  if (it == data.end() || !it->is_object()) {
    return out;
  }
  for (const auto& [k, v] : it->items()) {
    out.emplace(k, v.is_string() ? v.get<std::string>() : v.dump());
  }
  return out;
}

auto ProgressStore::clear_all() -> std::size_t {
  auto removed = store_->remove_prefix(kKeyPrefix);
  if (!removed) {
    log::error("Failed to clear checkpoints: {}", removed.error().message());
    return 0;
  }
  if (*removed > 0) {
    log::info("Cleared {} checkpoint(s)", *removed);
  }
  return *removed;
}

auto ProgressStore::load_all() const -> std::map<std::string, ProgressData> {
  std::map<std::string, ProgressData> out;
  auto rows = store_->scan_prefix(kKeyPrefix);
  if (!rows) {
    log::error("Failed to list checkpoints: {}", rows.error().message());
    return out;
  }
  for (const auto& [name, raw] : *rows) {
    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      continue;
    }
    out.emplace(name.substr(kKeyPrefix.size()), std::move(parsed));
  }
  return out;
}

auto ProgressStore::list_all() const -> std::vector<std::string> {
  std::vector<std::string> ids;
  for (auto& [task_id, _] : load_all()) {
    ids.push_back(task_id);
  }
  return ids;
}

auto ProgressStore::count() const -> std::size_t {
  auto n = store_->count_prefix(kKeyPrefix);
  if (!n) {
    log::error("Failed to count checkpoints: {}", n.error().message());
    return 0;
  }
  return *n;
}

auto ProgressStore::prune_stale(std::chrono::seconds max_age) -> std::size_t {
  auto rows = store_->scan_prefix(kKeyPrefix);
  if (!rows) {
    log::error("Failed to list checkpoints: {}", rows.error().message());
    return 0;
  }
  auto cutoff = clock_->now() - max_age;
  std::size_t pruned = 0;
  // Raw rows, so an unparseable checkpoint counts as undated.
  for (const auto& [name, raw] : *rows) {
    auto saved = saved_at_of(parse_checkpoint(raw));
    if (saved && *saved >= cutoff) {
      continue;
    }
    ProgressStore stale{*store_, name, *clock_};
    if (stale.clear()) {
      ++pruned;
    }
  }
  if (pruned > 0) {
    log::info("Pruned {} stale checkpoint(s)", pruned);
  }
  return pruned;
}

auto ProgressStore::statistics(std::chrono::seconds stale_after) const
    -> ProgressStatistics {
  ProgressStatistics stats;
  auto cutoff = clock_->now() - stale_after;
  for (const auto& [task_id, data] : load_all()) {
    ++stats.total;
    if (data.contains("interrupted_at")) {
      ++stats.interrupted;
    }
    auto saved = saved_at_of(data);
    if (!saved) {
      ++stats.stale;
      continue;
    }
    if (*saved < cutoff) {
      ++stats.stale;
    }
    if (!stats.oldest || *saved < *stats.oldest) {
      stats.oldest = saved;
    }
    if (!stats.newest || *saved > *stats.newest) {
      stats.newest = saved;
    }
  }
  return stats;
}

}  // namespace upkeep
