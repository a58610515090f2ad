#pragma once

#include <string>
#include <string_view>

#include "masterplan/release/v1.hpp"

namespace masterplan::release {

// Manifest schema version written into release.json.
inline constexpr int kManifestVersion = 3;

/*
  release.json encoding.

  JSON uses the proto field names and prints every field, so viewers see
  a stable shape. The checksum covers the deterministic binary
  serialization of the manifest with its checksum field cleared, which
  does not depend on JSON whitespace or key order.
*/

std::string ManifestToJson(const masterplan::release::v1::ReleaseManifest& manifest);

// Throws util::ValidationError on malformed JSON or unknown fields.
masterplan::release::v1::ReleaseManifest ManifestFromJson(std::string_view json);

std::string CanonicalBytes(const masterplan::release::v1::ReleaseManifest& manifest);

// "sha256:" + hex over CanonicalBytes.
std::string ComputeChecksum(const masterplan::release::v1::ReleaseManifest& manifest);

} // namespace masterplan::release
