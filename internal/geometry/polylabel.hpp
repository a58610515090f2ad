#pragma once

#include <vector>

#include "internal/geometry/geometry.hpp"

namespace masterplan::geometry {

/*
  Pole of inaccessibility: the interior point farthest from every ring
  edge, found by quadtree cell refinement until no cell can improve the
  best candidate by more than `precision`.

  Rings use even-odd containment, so inner rings act as holes. A
  degenerate (zero width or height) input returns its bounds centre.
*/
Point PoleOfInaccessibility(const std::vector<Ring>& rings, double precision);

// Signed distance from `p` to the ring edges; positive inside.
double SignedDistance(const Point& p, const std::vector<Ring>& rings);

} // namespace masterplan::geometry
