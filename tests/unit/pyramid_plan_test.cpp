#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/tiling/pyramid_plan.hpp"

namespace {

using masterplan::tiling::LevelCount;
using masterplan::tiling::OptimalTileSize;
using masterplan::tiling::PlanPyramid;

void TestSquareSourceProducesFiveLevels() {
  const auto plan = PlanPyramid(4096, 4096, 256, 0);
  assert(plan.LevelCount() == 5);

  const auto& finest = plan.levels.back();
  assert(finest.width == 4096 && finest.height == 4096);
  assert(finest.cols == 16 && finest.rows == 16);
  assert(finest.TileCount() == 256);

  const auto& coarsest = plan.levels.front();
  assert(coarsest.level == 0);
  assert(coarsest.width == 256 && coarsest.height == 256);
  assert(coarsest.TileCount() == 1);

  assert(plan.TotalTiles() == 256 + 64 + 16 + 4 + 1);
}

void TestCoarserLevelsNeverHaveMoreTiles() {
  const auto plan = PlanPyramid(3000, 1700, 256, 1);
  for (size_t i = 1; i < plan.levels.size(); ++i) {
    assert(plan.levels[i - 1].TileCount() <= plan.levels[i].TileCount());
    assert(plan.levels[i].level == static_cast<int>(i));
  }

  const auto& finest = plan.levels.back();
  assert(finest.cols == 12); // ceil(3000 / 256)
  assert(finest.rows == 7);  // ceil(1700 / 256)
}

void TestSmallSourceIsSingleLevel() {
  assert(LevelCount(200, 100, 256) == 1);
  assert(LevelCount(256, 256, 256) == 1);
  assert(LevelCount(257, 10, 256) == 2);

  const auto plan = PlanPyramid(200, 100, 256, 0);
  assert(plan.LevelCount() == 1);
  assert(plan.levels[0].cols == 1 && plan.levels[0].rows == 1);
}

void TestLevelDimensionsRoundUp() {
  const auto plan = PlanPyramid(1001, 999, 256, 0);
  assert(plan.LevelCount() == 3);
  assert(plan.levels[0].width == 251); // ceil(1001 / 4)
  assert(plan.levels[0].height == 250);
  assert(plan.levels[2].width == 1001);
}

void TestEdgeTilesAreClippedNotPadded() {
  const auto  plan  = PlanPyramid(600, 300, 256, 0);
  const auto& level = plan.levels.back();
  assert(level.cols == 3 && level.rows == 2);

  const auto last = plan.TileBounds(level, 2, 1);
  assert(last.x == 512 && last.y == 256);
  assert(last.w == 88 && last.h == 44);
}

void TestOverlapStaysInsideLevel() {
  const auto  plan  = PlanPyramid(600, 300, 256, 2);
  const auto& level = plan.levels.back();

  const auto first = plan.TileBounds(level, 0, 0);
  assert(first.x == 0 && first.y == 0);
  assert(first.w == 258 && first.h == 258);

  const auto middle = plan.TileBounds(level, 1, 0);
  assert(middle.x == 254);
  assert(middle.w == 260);

  const auto last = plan.TileBounds(level, 2, 1);
  assert(last.x == 510 && last.y == 254);
  assert(last.x + last.w == 600 && last.y + last.h == 300);

  bool threw = false;
  try {
    (void)plan.TileBounds(level, 3, 0);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidDimensionsAreRejected() {
  bool threw = false;
  try {
    (void)LevelCount(0, 100, 256);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestOptimalTileSize() {
  assert(OptimalTileSize(2048, 1000) == 256);
  assert(OptimalTileSize(4096, 4096) == 512);
  assert(OptimalTileSize(10000, 500) == 1024);
}

} // namespace

int main() {
  TestSquareSourceProducesFiveLevels();
  TestCoarserLevelsNeverHaveMoreTiles();
  TestSmallSourceIsSingleLevel();
  TestLevelDimensionsRoundUp();
  TestEdgeTilesAreClippedNotPadded();
  TestOverlapStaysInsideLevel();
  TestInvalidDimensionsAreRejected();
  TestOptimalTileSize();

  std::cout << "masterplan_unit_pyramid_plan: pass\n";
  return 0;
}
