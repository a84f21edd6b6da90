#pragma once

#include "upkeep/scheduler/task_result.hpp"
#include "upkeep/storage/kv_store.hpp"
#include "upkeep/util/clock.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace upkeep {

// A checkpoint is a JSON object. The store owns `saved_at`,
// `interrupted_at`, `completed_tasks` and `errors`; every other field is
// task-specific resume state.
using ProgressData = nlohmann::json;

struct ProgressStatistics {
  std::size_t total{0};
  std::size_t stale{0};
  std::size_t interrupted{0};
  std::optional<TimePoint> oldest;
  std::optional<TimePoint> newest;
};

// Durable checkpoint of one task, stored under `upkeep_progress_<task_id>`.
//
// A store constructed without a key is unbound: writes return false and
// reads return empty values. The read-modify-write helpers are serialized
// per key within the process; writers in other processes can still race.
class ProgressStore {
public:
  static constexpr std::string_view kKeyPrefix = "upkeep_progress_";
  static constexpr std::chrono::seconds kDefaultStaleAge{3600};
  static constexpr std::chrono::seconds kDefaultPruneAge{86400};

  explicit ProgressStore(KvStore& store, std::string key = {},
                         const Clock& clock = system_clock());

  [[nodiscard]] static auto for_task(KvStore& store, std::string_view task_id,
                                     const Clock& clock = system_clock())
      -> ProgressStore;
  [[nodiscard]] static auto key_for(std::string_view task_id) -> std::string;

  [[nodiscard]] auto key() const noexcept -> const std::string& {
    return key_;
  }
  [[nodiscard]] auto is_bound() const noexcept -> bool {
    return !key_.empty();
  }

  // Empty object when there is no checkpoint or the store is unbound.
  [[nodiscard]] auto load() const -> ProgressData;
  // Replaces the checkpoint and stamps `saved_at`.
  auto save(ProgressData data) -> bool;
  // save() plus `interrupted_at = now`; `errors` are merged into the data.
  auto save_interrupted(ProgressData data, const ErrorMap& errors = {})
      -> bool;
  // Shallow merge of `partial` into the current checkpoint.
  auto update(const ProgressData& partial) -> bool;
  auto add_completed_task(std::string_view name) -> bool;
  auto add_error(std::string_view key, std::string_view message) -> bool;
  auto increment(std::string_view counter, std::int64_t delta = 1) -> bool;

  [[nodiscard]] auto has_progress() const -> bool;
  // True when now - saved_at > threshold, or when there is no saved_at.
  [[nodiscard]] auto is_stale(
      std::chrono::seconds threshold = kDefaultStaleAge) const -> bool;
  auto clear() -> bool;

  [[nodiscard]] auto saved_at() const -> std::optional<TimePoint>;
  [[nodiscard]] auto interrupted_at() const -> std::optional<TimePoint>;
  [[nodiscard]] auto completed_tasks() const -> std::vector<std::string>;
  [[nodiscard]] auto errors() const -> ErrorMap;

  // Operations across every task's checkpoint.
  auto clear_all() -> std::size_t;
  [[nodiscard]] auto list_all() const -> std::vector<std::string>;
  [[nodiscard]] auto load_all() const -> std::map<std::string, ProgressData>;
  [[nodiscard]] auto count() const -> std::size_t;
  // Removes checkpoints older than max_age or without a readable saved_at.
  auto prune_stale(std::chrono::seconds max_age = kDefaultPruneAge)
      -> std::size_t;
  [[nodiscard]] auto statistics(
      std::chrono::seconds stale_after = kDefaultPruneAge) const
      -> ProgressStatistics;

private:
  [[nodiscard]] auto read() const -> ProgressData;
  auto write(ProgressData data) -> bool;
  template <typename Fn>
  auto modify(Fn&& fn) -> bool;

  KvStore* store_;
  std::string key_;
  const Clock* clock_;
};

}  // namespace upkeep
