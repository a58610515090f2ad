#include "release_id.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace masterplan::util {
namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

std::string Hex(const uint8_t* data, size_t size) {
  std::ostringstream oss;
  for (size_t i = 0; i < size; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool IsLowerHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

std::string GenerateReleaseId(TimePoint at) {
  std::array<uint8_t, 4> suffix{};
  for (auto& b : suffix)
    b = static_cast<uint8_t>(Rng()());

  return "rel_" + ToCompactStamp(at) + "_" + Hex(suffix.data(), suffix.size());
}

std::string GenerateJobId() {
  std::array<uint8_t, 16> id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(Rng()());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  std::string hex = Hex(id.data(), id.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}

bool IsReleaseId(const std::string& id) {
  // rel_ + 14 digits + _ + 8 hex
  if (id.size() != 4 + 14 + 1 + 8 || id.compare(0, 4, "rel_") != 0 || id[18] != '_') {
    return false;
  }
  for (size_t i = 4; i < 18; ++i) {
    if (id[i] < '0' || id[i] > '9') return false;
  }
  for (size_t i = 19; i < id.size(); ++i) {
    if (!IsLowerHex(id[i])) return false;
  }
  return true;
}

} // namespace masterplan::util
