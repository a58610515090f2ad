#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace masterplan::util {

/*
  Identifier helpers.

  Release ids read as rel_{UTC yyyymmddHHMMSS}_{8 hex}; the random suffix
  keeps two publishes within the same second distinct. Job ids are
  RFC4122 v4 UUID strings.
*/

std::string GenerateReleaseId(TimePoint at);
std::string GenerateJobId();

bool IsReleaseId(const std::string& id);

} // namespace masterplan::util
