#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "masterplan/release/v1.hpp"

namespace masterplan::geometry {

struct ImportOptions {
  // Ids must match this regex at their start; empty imports everything.
  std::string id_pattern;
  // Use the nearest ancestor <g id> as the layer ("root" when none).
  bool        group_by_parent = false;
  std::string overlay_type    = "unit";
  std::string layer;
  std::string default_locale  = "en";
  double      precision       = 1.0;
  double      curve_tolerance = 0.5;
};

struct ImportResult {
  std::vector<masterplan::release::v1::ReleaseOverlay> overlays;
  // Elements that were skipped, with the reason.
  std::vector<masterplan::release::v1::GeometryIssue> errors;
  std::optional<std::string>                          view_box;
};

/*
  SVG document → overlay records.

  <path d>, <polygon points> and <polyline points> are imported in
  document order. Each overlay carries its geometry, a default label and a
  label_position inside its bounding box.

  Per-element problems (parse errors, non-finite coordinates, duplicate
  refs) are collected in ImportResult::errors and never thrown.

  Throws:
    util::SourceAssetError  malformed XML, or nothing importable
    util::ValidationError   invalid id_pattern
*/
class GeometryImporter {
 public:
  explicit GeometryImporter(ImportOptions options);

  ImportResult Import(std::string_view document) const;

  // "unit-a_12" → "a 12"; falls back to the id when nothing is left.
  static std::string DefaultLabel(const std::string& id);

 private:
  ImportOptions options_;
};

} // namespace masterplan::geometry
