#include "checksum.hpp"

#include <openssl/sha.h>

#include <array>

namespace masterplan::util {

std::string Sha256Checksum(std::string_view data) {
  std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out    = "sha256:";
  out.reserve(out.size() + digest.size() * 2);
  for (unsigned char b : digest) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace masterplan::util
