#pragma once

#include <cstdint>
#include <string>

namespace masterplan::db::model {

/*
  Release history row. The manifest itself lives in the blob store under
  manifest_key; this row only indexes it.
*/
struct ReleaseRecord {
  std::string release_id;
  std::string project_slug;
  std::string draft_id;
  std::string manifest_key;
  std::string checksum;
  std::string published_by;

  int32_t  overlay_count   = 0;
  int64_t  tile_count      = 0;
  uint64_t published_at_ms = 0;
};

// Per-project pointer to the release viewers should load.
struct CurrentReleaseRecord {
  std::string project_slug;
  std::string release_id;
  uint64_t    updated_at_ms = 0;
};

} // namespace masterplan::db::model
