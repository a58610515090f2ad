#pragma once

#include <cstdint>
#include <string>

#include "internal/imaging/raster_image.hpp"
#include "internal/tiling/pyramid_plan.hpp"
#include "masterplan/release/v1.hpp"

namespace masterplan::tiling {

struct TileOptions {
  int                 tile_size = 256;
  int                 overlap   = 0;
  imaging::TileFormat format    = imaging::TileFormat::kPng;
  int                 quality   = 90;
};

/*
  Result of a generation run: the plan that was realised plus where the
  tiles went. Tiles live under `prefix` as {level}/{col}_{row}.{ext}.
*/
struct TilePyramid {
  PyramidPlan plan;
  TileOptions options;
  std::string prefix;
  int64_t     tile_count = 0;

  std::string Extension() const {
    return imaging::Extension(options.format);
  }

  // tiles block of the manifest, minus base_url
  masterplan::release::v1::TileConfig ToTileConfig() const;
};

} // namespace masterplan::tiling
