#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>

#include "internal/geometry/geometry.hpp"
#include "internal/geometry/polylabel.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace masterplan::geometry;

std::vector<Ring> Square(double size) {
  return {Ring{{0, 0}, {size, 0}, {size, size}, {0, size}}};
}

void TestSquareAnchorIsItsCentre() {
  const auto pole = PoleOfInaccessibility(Square(100), 1.0);
  assert(std::fabs(pole.x - 50.0) <= 1.0);
  assert(std::fabs(pole.y - 50.0) <= 1.0);
}

void TestSignedDistanceIsPositiveInside() {
  const auto rings = Square(100);
  assert(std::fabs(SignedDistance({50, 50}, rings) - 50.0) < 1e-9);
  assert(std::fabs(SignedDistance({10, 50}, rings) - 10.0) < 1e-9);
  assert(std::fabs(SignedDistance({150, 50}, rings) + 50.0) < 1e-9);
}

void TestConcaveShapeKeepsAnchorInside() {
  // L shape whose bounding-box centre lies outside the polygon
  const std::vector<Ring> rings{Ring{{0, 0}, {100, 0}, {100, 20}, {20, 20}, {20, 100}, {0, 100}}};
  assert(SignedDistance({50, 50}, rings) < 0);

  const auto pole = PoleOfInaccessibility(rings, 0.5);
  assert(SignedDistance(pole, rings) > 0);
}

void TestHoleIsAvoided() {
  const std::vector<Ring> rings{
      Ring{{0, 0}, {100, 0}, {100, 100}, {0, 100}},
      Ring{{20, 20}, {80, 20}, {80, 80}, {20, 80}},
  };
  const auto pole = PoleOfInaccessibility(rings, 0.5);
  assert(SignedDistance(pole, rings) > 0);

  const bool in_hole = pole.x > 20 && pole.x < 80 && pole.y > 20 && pole.y < 80;
  assert(!in_hole);
}

void TestDegenerateInputReturnsBoundsCentre() {
  const std::vector<Ring> line{Ring{{0, 0}, {10, 0}, {4, 0}}};
  const auto              pole = PoleOfInaccessibility(line, 1.0);
  assert(pole.x == 5.0 && pole.y == 0.0);
}

void TestAnalyzeUsesPoleForPolygons() {
  const auto path = Analyze(PolygonShape{{{0, 0}, {100, 0}, {100, 100}, {0, 100}}}, 0.5, 1.0);
  assert(path.PointCount() == 4);
  assert(path.bounds.min_x == 0 && path.bounds.max_x == 100);
  assert(std::fabs(path.anchor.x - 50.0) <= 1.0);
  assert(std::fabs(path.anchor.y - 50.0) <= 1.0);

  const auto from_path = Analyze(PathShape{"M0 0 H100 V100 H0 Z"}, 0.5, 1.0);
  assert(std::fabs(from_path.anchor.x - 50.0) <= 1.0);
  assert(std::fabs(from_path.anchor.y - 50.0) <= 1.0);
}

void TestThinStripStaysCheap() {
  const auto started = std::chrono::steady_clock::now();
  for (double height : {0.002, 0.0002}) {
    const auto strip = Analyze(PolygonShape{{{0, 0}, {20000, 0}, {20000, height}, {0, height}}}, 0.5, 1.0);
    assert(strip.anchor.x >= 0 && strip.anchor.x <= 20000);
    assert(strip.anchor.y >= 0 && strip.anchor.y <= height);
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed < std::chrono::seconds(1));
}

void TestAnalyzeFallsBackToBoundsCentre() {
  const auto point = Analyze(PointShape{{12, 34}}, 0.5, 1.0);
  assert(point.anchor.x == 12 && point.anchor.y == 34);

  const auto segment = Analyze(PolygonShape{{{0, 0}, {10, 20}}}, 0.5, 1.0);
  assert(segment.anchor.x == 5 && segment.anchor.y == 10);
}

void TestAnalyzeRejectsNonFiniteCoordinates() {
  bool threw = false;
  try {
    (void)Analyze(PolygonShape{{{0, 0}, {std::numeric_limits<double>::quiet_NaN(), 0}, {1, 1}}}, 0.5, 1.0);
  } catch (const masterplan::util::GeometryError&) {
    threw = true;
  }
  assert(threw);
}

void TestProtoConversion() {
  const Geometry polygon = PolygonShape{{{1, 2}, {3, 4}, {5, 6}}};
  const auto     proto   = ToProto(polygon);
  assert(proto.has_polygon());
  assert(proto.polygon().points_size() == 3);
  assert(proto.polygon().points(2).y() == 6);

  const auto back = FromProto(proto);
  assert(std::get<PolygonShape>(back).points.size() == 3);

  bool threw = false;
  try {
    (void)FromProto(masterplan::release::v1::Geometry{});
  } catch (const masterplan::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSquareAnchorIsItsCentre();
  TestSignedDistanceIsPositiveInside();
  TestConcaveShapeKeepsAnchorInside();
  TestHoleIsAvoided();
  TestDegenerateInputReturnsBoundsCentre();
  TestAnalyzeUsesPoleForPolygons();
  TestThinStripStaysCheap();
  TestAnalyzeFallsBackToBoundsCentre();
  TestAnalyzeRejectsNonFiniteCoordinates();
  TestProtoConversion();

  std::cout << "masterplan_unit_polylabel: pass\n";
  return 0;
}
