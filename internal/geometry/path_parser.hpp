#pragma once

#include <string_view>
#include <vector>

#include "internal/geometry/geometry.hpp"

namespace masterplan::geometry {

/*
  SVG path data → polylines.

  All commands (M L H V C S Q T A Z, absolute and relative) are
  interpreted. Curves and arcs are flattened so no point of the curve is
  further than `tolerance` from the emitted chords. Every moveto starts a
  new ring.

  Throws util::GeometryError on syntax errors and non-finite numbers.
*/
std::vector<Ring> ParsePathData(std::string_view d, double tolerance);

// "x1,y1 x2,y2 ..." as used by <polygon points>. Same error contract.
std::vector<Point> ParsePointList(std::string_view points);

} // namespace masterplan::geometry
