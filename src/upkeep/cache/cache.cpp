#include "upkeep/cache/cache.hpp"

#include <charconv>

namespace upkeep {

auto numeric_value(const CacheValue& value) -> std::optional<std::int64_t> {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    return static_cast<std::int64_t>(value.get<double>());
  }
  if (!value.is_string()) {
    return std::nullopt;
  }

  const auto& s = value.get_ref<const std::string&>();
  if (s.empty()) {
    return std::nullopt;
  }
  const char* first = s.data();
  const char* last = s.data() + s.size();

  std::int64_t n = 0;
  if (auto [ptr, ec] = std::from_chars(first, last, n);
      ec == std::errc{} && ptr == last) {
    return n;
  }
  double d = 0.0;
  if (auto [ptr, ec] = std::from_chars(first, last, d);
      ec == std::errc{} && ptr == last) {
    return static_cast<std::int64_t>(d);
  }
  return std::nullopt;
}

}  // namespace upkeep
