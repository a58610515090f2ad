#pragma once

#include <string>
#include <string_view>

namespace masterplan::util {

// "sha256:" + lowercase hex digest of data.
std::string Sha256Checksum(std::string_view data);

} // namespace masterplan::util
