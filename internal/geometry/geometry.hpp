#pragma once

#include <string>
#include <variant>
#include <vector>

#include "masterplan/release/v1.hpp"

namespace masterplan::geometry {

struct Point {
  double x = 0.0;
  double y = 0.0;
};

using Ring = std::vector<Point>;

struct BoundingBox {
  double min_x = 0.0;
  double min_y = 0.0;
  double max_x = 0.0;
  double max_y = 0.0;

  Point Center() const {
    return {(min_x + max_x) / 2.0, (min_y + max_y) / 2.0};
  }

  double Width() const {
    return max_x - min_x;
  }
  double Height() const {
    return max_y - min_y;
  }

  bool Contains(const Point& p, double epsilon = 1e-9) const {
    return p.x >= min_x - epsilon && p.x <= max_x + epsilon && p.y >= min_y - epsilon && p.y <= max_y + epsilon;
  }
};

// ------------------------------------------------------------------
// Overlay geometry: Path{d} | Polygon{points} | Point{x,y}
// ------------------------------------------------------------------

struct PathShape {
  std::string d;
};

struct PolygonShape {
  std::vector<Point> points;
};

struct PointShape {
  Point at;
};

using Geometry = std::variant<PathShape, PolygonShape, PointShape>;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

masterplan::release::v1::Geometry ToProto(const Geometry& geometry);

// Throws util::ValidationError when no shape is set.
Geometry FromProto(const masterplan::release::v1::Geometry& geometry);

/*
  Coordinates, bounds and label anchor computed from one Geometry.
  Immutable once built.
*/
struct GeometryPath {
  std::vector<Ring> rings;
  BoundingBox       bounds;
  Point             anchor;

  size_t PointCount() const;
};

// min/max over every coordinate; rings must not all be empty.
BoundingBox BoundsOf(const std::vector<Ring>& rings);

/*
  Flattens the geometry (curves to `curve_tolerance`) and places the
  label: pole of inaccessibility at `precision` for >= 3 points,
  bounding-box centre otherwise.

  Throws util::GeometryError on malformed or non-finite data.
*/
GeometryPath Analyze(const Geometry& geometry, double curve_tolerance, double precision);

} // namespace masterplan::geometry
