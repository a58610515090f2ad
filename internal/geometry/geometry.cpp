#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/geometry/path_parser.hpp"
#include "internal/geometry/polylabel.hpp"
#include "internal/util/errors.hpp"

namespace masterplan::geometry {

namespace v1 = masterplan::release::v1;

v1::Geometry ToProto(const Geometry& geometry) {
  v1::Geometry out;
  std::visit(Overloaded{
                 [&](const PathShape& path) { out.mutable_path()->set_d(path.d); },
                 [&](const PolygonShape& polygon) {
                   auto* points = out.mutable_polygon();
                   for (const auto& p : polygon.points) {
                     auto* point = points->add_points();
                     point->set_x(p.x);
                     point->set_y(p.y);
                   }
                 },
                 [&](const PointShape& point) {
                   out.mutable_point()->set_x(point.at.x);
                   out.mutable_point()->set_y(point.at.y);
                 },
             },
             geometry);
  return out;
}

Geometry FromProto(const v1::Geometry& geometry) {
  switch (geometry.shape_case()) {
    case v1::Geometry::kPath:
      return PathShape{geometry.path().d()};
    case v1::Geometry::kPolygon: {
      PolygonShape polygon;
      polygon.points.reserve(geometry.polygon().points_size());
      for (const auto& p : geometry.polygon().points()) {
        polygon.points.push_back({p.x(), p.y()});
      }
      return polygon;
    }
    case v1::Geometry::kPoint:
      return PointShape{{geometry.point().x(), geometry.point().y()}};
    case v1::Geometry::SHAPE_NOT_SET:
      break;
  }
  throw util::ValidationError("geometry has no shape");
}

size_t GeometryPath::PointCount() const {
  size_t count = 0;
  for (const auto& ring : rings) {
    count += ring.size();
  }
  return count;
}

BoundingBox BoundsOf(const std::vector<Ring>& rings) {
  BoundingBox box{std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity(),
                  -std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity()};
  bool any = false;
  for (const auto& ring : rings) {
    for (const auto& p : ring) {
      box.min_x = std::min(box.min_x, p.x);
      box.min_y = std::min(box.min_y, p.y);
      box.max_x = std::max(box.max_x, p.x);
      box.max_y = std::max(box.max_y, p.y);
      any       = true;
    }
  }
  if (!any) {
    throw util::GeometryError("geometry has no coordinates");
  }
  return box;
}

GeometryPath Analyze(const Geometry& geometry, double curve_tolerance, double precision) {
  GeometryPath out;
  out.rings = std::visit(Overloaded{
                             [&](const PathShape& path) { return ParsePathData(path.d, curve_tolerance); },
                             [&](const PolygonShape& polygon) {
                               for (const auto& p : polygon.points) {
                                 if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
                                   throw util::GeometryError("non-finite polygon coordinate");
                                 }
                               }
                               return std::vector<Ring>{polygon.points};
                             },
                             [&](const PointShape& point) {
                               if (!std::isfinite(point.at.x) || !std::isfinite(point.at.y)) {
                                 throw util::GeometryError("non-finite point coordinate");
                               }
                               return std::vector<Ring>{Ring{point.at}};
                             },
                         },
                         geometry);

  out.bounds = BoundsOf(out.rings);
  out.anchor = out.PointCount() >= 3 ? PoleOfInaccessibility(out.rings, precision) : out.bounds.Center();
  if (!out.bounds.Contains(out.anchor)) {
    // self-intersecting input can pull the centroid seed outside
    out.anchor = out.bounds.Center();
  }
  return out;
}

} // namespace masterplan::geometry
