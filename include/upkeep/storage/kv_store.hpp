#pragma once

#include "upkeep/core/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace upkeep {

// Durable key/value storage shared by the fallback cache, checkpoints, the
// local scheduler queue and the lock-based rate limiter.
class KvStore {
public:
  using Entry = std::pair<std::string, std::string>;

  virtual ~KvStore() = default;

  [[nodiscard]] virtual auto get(std::string_view key)
      -> Result<std::optional<std::string>> = 0;

  // Insert or overwrite.
  [[nodiscard]] virtual auto put(std::string_view key, std::string_view value)
      -> Result<void> = 0;

  // Returns whether a row was removed.
  [[nodiscard]] virtual auto remove(std::string_view key) -> Result<bool> = 0;

  // Deletes both rows in one statement. Returns how many were removed.
  [[nodiscard]] virtual auto remove_pair(std::string_view key1,
                                         std::string_view key2)
      -> Result<std::size_t> = 0;

  // Inserts both rows in one statement, skipping any key that already
  // exists. Returns how many rows were actually inserted (0, 1 or 2).
  [[nodiscard]] virtual auto insert_pair_if_absent(std::string_view key1,
                                                   std::string_view value1,
                                                   std::string_view key2,
                                                   std::string_view value2)
      -> Result<int> = 0;

  // The prefix is literal: wildcard characters in it match only themselves.
  [[nodiscard]] virtual auto remove_prefix(std::string_view prefix)
      -> Result<std::size_t> = 0;
  [[nodiscard]] virtual auto scan_prefix(std::string_view prefix)
      -> Result<std::vector<Entry>> = 0;
  [[nodiscard]] virtual auto count_prefix(std::string_view prefix)
      -> Result<std::size_t> = 0;
};

}  // namespace upkeep
