#include "upkeep/util/time.hpp"

#include <format>
#include <iomanip>
#include <sstream>

#include <ctime>

namespace upkeep::util {

auto format_datetime(TimePoint tp) -> std::string {
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

auto parse_datetime(std::string_view text) -> std::optional<TimePoint> {
  std::tm tm{};
  std::istringstream in{std::string(text)};
  in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }
  auto secs = ::timegm(&tm);
  if (secs == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return from_unix_seconds(static_cast<std::int64_t>(secs));
}

auto timestamp_from_json(const nlohmann::json& value)
    -> std::optional<TimePoint> {
  if (value.is_number_integer()) {
    return from_unix_seconds(value.get<std::int64_t>());
  }
  if (value.is_number_float()) {
    return from_unix_seconds(static_cast<std::int64_t>(value.get<double>()));
  }
  if (value.is_string()) {
    const auto& s = value.get_ref<const std::string&>();
    if (s.empty()) {
      return std::nullopt;
    }
    return parse_datetime(s);
  }
  return std::nullopt;
}

}  // namespace upkeep::util
