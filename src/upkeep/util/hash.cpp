#include "upkeep/util/hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>

namespace upkeep::util {

auto md5_hex(std::string_view data) -> std::string {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;

  if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_md5(),
                 nullptr) != 1) {
    len = 0;
  }

  std::string hex;
  hex.reserve(static_cast<std::size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    std::format_to(std::back_inserter(hex), "{:02x}", digest[i]);
  }
  return hex;
}

}  // namespace upkeep::util
