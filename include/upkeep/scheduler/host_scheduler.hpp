#pragma once

#include "upkeep/util/clock.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace upkeep {

// The scheduling primitive that actually fires tasks. One pending execution
// per task id; scheduling a task again replaces its pending execution.
class HostScheduler {
public:
  virtual ~HostScheduler() = default;

  virtual auto schedule(std::string_view task_id, TimePoint at) -> bool = 0;
  // False only when the removal itself failed.
  virtual auto unschedule(std::string_view task_id) -> bool = 0;
  [[nodiscard]] virtual auto is_scheduled(std::string_view task_id) -> bool = 0;
  [[nodiscard]] virtual auto list_scheduled()
      -> std::map<std::string, TimePoint> = 0;

  [[nodiscard]] virtual auto next_scheduled(std::string_view task_id)
      -> std::optional<TimePoint> {
    auto all = list_scheduled();
    auto it = all.find(std::string{task_id});
    if (it == all.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  // Whether the backend can run recurring schedules natively.
  [[nodiscard]] virtual auto supports_recurring() const -> bool {
    return false;
  }
};

}  // namespace upkeep
