#include "polylabel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>

namespace masterplan::geometry {

namespace {

constexpr double kSqrt2 = 1.4142135623730951;

double SegmentDistanceSq(const Point& p, const Point& a, const Point& b) {
  double x  = a.x;
  double y  = a.y;
  double dx = b.x - x;
  double dy = b.y - y;

  if (dx != 0.0 || dy != 0.0) {
    const double t = ((p.x - x) * dx + (p.y - y) * dy) / (dx * dx + dy * dy);
    if (t > 1) {
      x = b.x;
      y = b.y;
    } else if (t > 0) {
      x += dx * t;
      y += dy * t;
    }
  }

  dx = p.x - x;
  dy = p.y - y;
  return dx * dx + dy * dy;
}

struct Cell {
  Cell(const Point& c, double half, const std::vector<Ring>& rings)
      : center(c), h(half), d(SignedDistance(c, rings)), max(d + h * kSqrt2) {
  }

  Point  center;
  double h;   // half the cell size
  double d;   // distance from centre to polygon
  double max; // upper bound for any point in the cell
};

struct CompareMax {
  bool operator()(const Cell& a, const Cell& b) const {
    return a.max < b.max;
  }
};

// Area-weighted centroid of the first ring, falling back to its first vertex.
Cell CentroidCell(const std::vector<Ring>& rings) {
  const Ring& ring = rings.front();
  double      area = 0.0;
  double      x    = 0.0;
  double      y    = 0.0;
  for (size_t i = 0, len = ring.size(), j = len - 1; i < len; j = i++) {
    const Point& a = ring[i];
    const Point& b = ring[j];
    const double f = a.x * b.y - b.x * a.y;
    x += (a.x + b.x) * f;
    y += (a.y + b.y) * f;
    area += f * 3;
  }
  if (area == 0.0) {
    return Cell(ring.front(), 0, rings);
  }
  return Cell({x / area, y / area}, 0, rings);
}

} // namespace

double SignedDistance(const Point& p, const std::vector<Ring>& rings) {
  bool   inside       = false;
  double min_dist_sq  = std::numeric_limits<double>::infinity();

  for (const auto& ring : rings) {
    if (ring.empty()) continue;
    for (size_t i = 0, len = ring.size(), j = len - 1; i < len; j = i++) {
      const Point& a = ring[i];
      const Point& b = ring[j];
      if ((a.y > p.y) != (b.y > p.y) && (p.x < (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x)) {
        inside = !inside;
      }
      min_dist_sq = std::min(min_dist_sq, SegmentDistanceSq(p, a, b));
    }
  }

  const double dist = std::sqrt(min_dist_sq);
  return inside ? dist : -dist;
}

Point PoleOfInaccessibility(const std::vector<Ring>& rings, double precision) {
  precision = std::max(precision, 1e-6);

  const BoundingBox box   = BoundsOf(rings);
  const double      width = box.Width();
  const double      height = box.Height();
  if (std::min(width, height) == 0.0) {
    return box.Center();
  }

  // seed cells never smaller than precision, so thin strips stay a short row
  const double cell_size = std::max(precision, std::min(width, height));

  std::priority_queue<Cell, std::vector<Cell>, CompareMax> queue;

  double h = cell_size / 2;
  for (double x = box.min_x; x < box.max_x; x += cell_size) {
    for (double y = box.min_y; y < box.max_y; y += cell_size) {
      queue.push(Cell({x + h, y + h}, h, rings));
    }
  }

  Cell best = CentroidCell(rings);

  const Cell center_cell(box.Center(), 0, rings);
  if (center_cell.d > best.d) best = center_cell;

  while (!queue.empty()) {
    Cell cell = queue.top();
    queue.pop();

    if (cell.d > best.d) {
      best = cell;
    }

    // no point refining a cell that cannot beat the best by `precision`
    if (cell.max - best.d <= precision) continue;

    h = cell.h / 2;
    queue.push(Cell({cell.center.x - h, cell.center.y - h}, h, rings));
    queue.push(Cell({cell.center.x + h, cell.center.y - h}, h, rings));
    queue.push(Cell({cell.center.x - h, cell.center.y + h}, h, rings));
    queue.push(Cell({cell.center.x + h, cell.center.y + h}, h, rings));
  }

  return best.center;
}

} // namespace masterplan::geometry
