#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace masterplan::tiling {

/*
  Pure geometry of a tile pyramid. No pixels involved.

  Level 0 is the smallest; the last level is full resolution.
  Level l has dimensions ceil(W / 2^(levels-l-1)) x ceil(H / 2^(levels-l-1)).
*/

struct LevelPlan {
  int level  = 0;
  int width  = 0;
  int height = 0;
  int cols   = 0;
  int rows   = 0;

  int64_t TileCount() const {
    return static_cast<int64_t>(cols) * rows;
  }
};

// Pixel window of one tile inside its level, overlap included.
struct TileRect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;
};

struct PyramidPlan {
  int width     = 0;
  int height    = 0;
  int tile_size = 0;
  int overlap   = 0;

  std::vector<LevelPlan> levels;

  int LevelCount() const {
    return static_cast<int>(levels.size());
  }

  int64_t TotalTiles() const;

  /*
    DZI convention: a tile covers [col*T, col*T+T) clipped to the level,
    extended by `overlap` pixels towards every neighbour that exists.
  */
  TileRect TileBounds(const LevelPlan& level, int col, int row) const;
};

// ceil(log2(max(W,H)/T)) + 1, computed with integer halving; at least 1.
int LevelCount(int width, int height, int tile_size);

PyramidPlan PlanPyramid(int width, int height, int tile_size, int overlap);

// <=2048px → 256, <=8192px → 512, larger → 1024.
int OptimalTileSize(int width, int height);

} // namespace masterplan::tiling
