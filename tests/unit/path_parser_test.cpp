#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/geometry/path_parser.hpp"
#include "internal/util/errors.hpp"

namespace {

using masterplan::geometry::ParsePathData;
using masterplan::geometry::ParsePointList;
using masterplan::geometry::Point;

bool Near(const Point& p, double x, double y, double eps = 1e-9) {
  return std::fabs(p.x - x) <= eps && std::fabs(p.y - y) <= eps;
}

template <typename Fn>
bool ThrowsGeometryError(Fn&& fn) {
  try {
    fn();
  } catch (const masterplan::util::GeometryError&) {
    return true;
  }
  return false;
}

void TestAbsoluteLines() {
  const auto rings = ParsePathData("M0 0 L10 0 L10 10 Z", 0.5);
  assert(rings.size() == 1);
  assert(rings[0].size() == 3);
  assert(Near(rings[0][0], 0, 0));
  assert(Near(rings[0][1], 10, 0));
  assert(Near(rings[0][2], 10, 10));
}

void TestRelativeCommandsAndCompactNumbers() {
  const auto rings = ParsePathData("m10,10h5v5h-5z", 0.5);
  assert(rings.size() == 1);
  assert(rings[0].size() == 4);
  assert(Near(rings[0][1], 15, 10));
  assert(Near(rings[0][2], 15, 15));
  assert(Near(rings[0][3], 10, 15));

  // "10-5" is two numbers, ".5.5" too
  const auto packed = ParsePathData("M10-5L.5.5", 0.5);
  assert(Near(packed[0][0], 10, -5));
  assert(Near(packed[0][1], 0.5, 0.5));
}

void TestImplicitLinetoAfterMoveto() {
  const auto rings = ParsePathData("M0 0 10 0 10 10", 0.5);
  assert(rings.size() == 1);
  assert(rings[0].size() == 3);

  const auto relative = ParsePathData("m1 1 2 0 0 2", 0.5);
  assert(Near(relative[0][1], 3, 1));
  assert(Near(relative[0][2], 3, 3));
}

void TestEverySubpathIsARing() {
  const auto rings = ParsePathData("M0 0 L1 0 L1 1 Z M5 5 L6 5 L6 6 Z", 0.5);
  assert(rings.size() == 2);
  assert(Near(rings[1][0], 5, 5));

  // a segment after Z without a moveto starts again at the subpath start
  const auto reopened = ParsePathData("M0 0 L4 0 L4 4 Z L0 4", 0.5);
  assert(reopened.size() == 2);
  assert(Near(reopened[1][0], 0, 0));
  assert(Near(reopened[1][1], 0, 4));
}

void TestCubicIsFlattenedWithinTolerance() {
  const auto rings = ParsePathData("M0 0 C0 100 100 100 100 0", 0.5);
  assert(rings.size() == 1);

  const auto& ring = rings[0];
  assert(ring.size() > 4);
  assert(Near(ring.back(), 100, 0));

  // the curve peaks at (50, 75); every vertex is on the curve
  double max_y = 0.0;
  for (const auto& p : ring) {
    assert(p.y <= 75.0 + 1e-9);
    max_y = std::max(max_y, p.y);
  }
  assert(max_y >= 74.5);
}

void TestSmoothQuadraticReflectsControlPoint() {
  const auto rings = ParsePathData("M0 0 Q50 100 100 0 T200 0", 0.25);
  const auto& ring = rings[0];
  assert(Near(ring.back(), 200, 0));

  double min_y = 0.0;
  for (const auto& p : ring) {
    min_y = std::min(min_y, p.y);
  }
  // reflected control point sits at (150, -100)
  assert(min_y < -40.0);
}

void TestArcStaysOnItsCircle() {
  // flags written without separators
  const auto  rings = ParsePathData("M0 0 a50 50 0 01100 0", 0.1);
  const auto& ring  = rings[0];
  assert(ring.size() > 3);
  assert(Near(ring.back(), 100, 0));
  for (const auto& p : ring) {
    assert(std::fabs(std::hypot(p.x - 50.0, p.y) - 50.0) < 1e-6);
  }
}

void TestZeroRadiusArcIsALine() {
  const auto rings = ParsePathData("M0 0 A0 10 0 0 1 10 10", 0.5);
  assert(rings[0].size() == 2);
  assert(Near(rings[0][1], 10, 10));
}

void TestMalformedPathData() {
  assert(ThrowsGeometryError([] { (void)ParsePathData("L0 0", 0.5); }));
  assert(ThrowsGeometryError([] { (void)ParsePathData("M0 0 L1", 0.5); }));
  assert(ThrowsGeometryError([] { (void)ParsePathData("M0 0 X5 5", 0.5); }));
  assert(ThrowsGeometryError([] { (void)ParsePathData("M0 0 L nan 5", 0.5); }));
  assert(ThrowsGeometryError([] { (void)ParsePathData("M0 0 L inf 5", 0.5); }));
  assert(ThrowsGeometryError([] { (void)ParsePathData("M0 0 A5 5 0 2 0 10 10", 0.5); }));
  assert(ThrowsGeometryError([] { (void)ParsePathData("", 0.5); }));

  bool threw = false;
  try {
    (void)ParsePathData("M0 0 L1 1", 0.0);
  } catch (const masterplan::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestPointLists() {
  const auto points = ParsePointList("0,0 100,0 100,100 0,100");
  assert(points.size() == 4);
  assert(Near(points[2], 100, 100));

  const auto spaced = ParsePointList("  1 2,3 4  ");
  assert(spaced.size() == 2);
  assert(Near(spaced[1], 3, 4));

  assert(ThrowsGeometryError([] { (void)ParsePointList("0,0 1"); }));
  assert(ThrowsGeometryError([] { (void)ParsePointList("   "); }));
  assert(ThrowsGeometryError([] { (void)ParsePointList("0,0 NaN,1"); }));
  assert(ThrowsGeometryError([] { (void)ParsePointList("0,0 L 1,1"); }));
}

} // namespace

int main() {
  TestAbsoluteLines();
  TestRelativeCommandsAndCompactNumbers();
  TestImplicitLinetoAfterMoveto();
  TestEverySubpathIsARing();
  TestCubicIsFlattenedWithinTolerance();
  TestSmoothQuadraticReflectsControlPoint();
  TestArcStaysOnItsCircle();
  TestZeroRadiusArcIsALine();
  TestMalformedPathData();
  TestPointLists();

  std::cout << "masterplan_unit_path_parser: pass\n";
  return 0;
}
