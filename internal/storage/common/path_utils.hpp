#pragma once

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace masterplan::storage::common {

/*
  Storage key layout:

      {project}/releases/{release_id}/release.json
      {project}/releases/{release_id}/tiles.dzi
      {project}/releases/{release_id}/tiles/{level}/{col}_{row}.{ext}
      {project}/uploads/drafts/{draft_id}.json
      {project}/uploads/tiles/...
*/

inline void ValidateSegment(const std::string& segment, const char* what) {
  if (segment.empty()) {
    throw util::ValidationError(std::string(what) + " must not be empty");
  }
  for (char c : segment) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::ValidationError(std::string(what) + " contains invalid character");
    }
  }
  if (segment == "." || segment == "..") {
    throw util::ValidationError(std::string(what) + " must not be a relative path component");
  }
}

// Relative key made of valid segments, no leading or trailing '/'.
inline void ValidateKey(const std::string& key) {
  if (key.empty() || key.front() == '/' || key.back() == '/') {
    throw util::ValidationError("invalid storage key: '" + key + "'");
  }
  size_t start = 0;
  while (start <= key.size()) {
    auto end = key.find('/', start);
    if (end == std::string::npos) end = key.size();
    ValidateSegment(key.substr(start, end - start), "storage key segment");
    start = end + 1;
  }
}

inline std::string JoinKey(const std::string& prefix, const std::string& rest) {
  if (prefix.empty()) return rest;
  if (rest.empty()) return prefix;
  return prefix + "/" + rest;
}

inline std::string ReleasePrefix(const std::string& project_slug, const std::string& release_id) {
  ValidateSegment(project_slug, "project slug");
  ValidateSegment(release_id, "release id");
  return project_slug + "/releases/" + release_id;
}

inline std::string ReleaseManifestKey(const std::string& project_slug, const std::string& release_id) {
  return ReleasePrefix(project_slug, release_id) + "/release.json";
}

inline std::string ReleaseTilesPrefix(const std::string& project_slug, const std::string& release_id) {
  return ReleasePrefix(project_slug, release_id) + "/tiles";
}

inline std::string ReleaseDziKey(const std::string& project_slug, const std::string& release_id) {
  return ReleasePrefix(project_slug, release_id) + "/tiles.dzi";
}

inline std::string TileKey(int level, int col, int row, const std::string& ext) {
  return std::to_string(level) + "/" + std::to_string(col) + "_" + std::to_string(row) + "." + ext;
}

inline std::string DraftKey(const std::string& project_slug, const std::string& draft_id) {
  ValidateSegment(project_slug, "project slug");
  ValidateSegment(draft_id, "draft id");
  return project_slug + "/uploads/drafts/" + draft_id + ".json";
}

inline std::string UploadsTilesPrefix(const std::string& project_slug) {
  ValidateSegment(project_slug, "project slug");
  return project_slug + "/uploads/tiles";
}

// Asset keys named by a draft must stay inside the project's uploads/.
inline void ValidateUploadKey(const std::string& project_slug, const std::string& key) {
  ValidateKey(key);
  const std::string prefix = project_slug + "/uploads/";
  if (key.compare(0, prefix.size(), prefix) != 0) {
    throw util::ValidationError("asset '" + key + "' is outside " + prefix);
  }
}

} // namespace masterplan::storage::common
