#include "pyramid_plan.hpp"

#include <algorithm>
#include <stdexcept>

namespace masterplan::tiling {

namespace {

int CeilDiv(int value, int64_t divisor) {
  return static_cast<int>((value + divisor - 1) / divisor);
}

} // namespace

int64_t PyramidPlan::TotalTiles() const {
  int64_t total = 0;
  for (const auto& level : levels) {
    total += level.TileCount();
  }
  return total;
}

TileRect PyramidPlan::TileBounds(const LevelPlan& level, int col, int row) const {
  if (col < 0 || row < 0 || col >= level.cols || row >= level.rows) {
    throw std::out_of_range("tile outside level grid");
  }

  const int x0 = col * tile_size;
  const int y0 = row * tile_size;
  const int x1 = std::min(x0 + tile_size, level.width);
  const int y1 = std::min(y0 + tile_size, level.height);

  TileRect rect;
  rect.x = std::max(0, x0 - overlap);
  rect.y = std::max(0, y0 - overlap);
  rect.w = std::min(level.width, x1 + overlap) - rect.x;
  rect.h = std::min(level.height, y1 + overlap) - rect.y;
  return rect;
}

int LevelCount(int width, int height, int tile_size) {
  if (width <= 0 || height <= 0 || tile_size <= 0) {
    throw std::invalid_argument("pyramid dimensions must be positive");
  }

  int max_dim = std::max(width, height);
  int levels  = 1;
  while (max_dim > tile_size) {
    max_dim = (max_dim + 1) / 2;
    ++levels;
  }
  return levels;
}

PyramidPlan PlanPyramid(int width, int height, int tile_size, int overlap) {
  PyramidPlan plan;
  plan.width     = width;
  plan.height    = height;
  plan.tile_size = tile_size;
  plan.overlap   = overlap;

  const int count = LevelCount(width, height, tile_size);
  plan.levels.reserve(count);
  for (int l = 0; l < count; ++l) {
    const int64_t divisor = int64_t{1} << (count - l - 1);

    LevelPlan level;
    level.level  = l;
    level.width  = CeilDiv(width, divisor);
    level.height = CeilDiv(height, divisor);
    level.cols   = CeilDiv(level.width, tile_size);
    level.rows   = CeilDiv(level.height, tile_size);
    plan.levels.push_back(level);
  }
  return plan;
}

int OptimalTileSize(int width, int height) {
  const int max_dim = std::max(width, height);
  if (max_dim <= 2048) return 256;
  if (max_dim <= 8192) return 512;
  return 1024;
}

} // namespace masterplan::tiling
