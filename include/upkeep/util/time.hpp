#pragma once

#include "upkeep/util/clock.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace upkeep::util {

[[nodiscard]] inline auto to_unix_seconds(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_seconds(std::int64_t secs) -> TimePoint {
  return TimePoint{std::chrono::seconds{secs}};
}

// Stored timestamps have second granularity.
[[nodiscard]] inline auto whole_seconds(TimePoint tp) -> TimePoint {
  return std::chrono::floor<std::chrono::seconds>(tp);
}

// "YYYY-MM-DD HH:MM:SS" in UTC.
[[nodiscard]] auto format_datetime(TimePoint tp) -> std::string;
[[nodiscard]] auto parse_datetime(std::string_view text)
    -> std::optional<TimePoint>;

// Stored timestamps are epoch seconds. Older records carry datetime strings;
// both are accepted. Anything else reads as absent.
[[nodiscard]] auto timestamp_from_json(const nlohmann::json& value)
    -> std::optional<TimePoint>;

[[nodiscard]] inline auto timestamp_to_json(std::optional<TimePoint> tp)
    -> nlohmann::json {
  if (!tp) {
    return nullptr;
  }
  return to_unix_seconds(*tp);
}

}  // namespace upkeep::util
