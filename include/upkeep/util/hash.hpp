#pragma once

#include <string>
#include <string_view>

namespace upkeep::util {

// Lowercase hex MD5 digest (32 chars). Used to keep truncated storage keys
// unique, not for anything security related.
[[nodiscard]] auto md5_hex(std::string_view data) -> std::string;

}  // namespace upkeep::util
