#pragma once

#include <string>

#include "internal/tiling/tile_pyramid.hpp"

namespace masterplan::tiling {

/*
  Deep Zoom Image descriptor for the pyramid:

    <Image TileSize="256" Overlap="0" Format="png" xmlns="...">
      <Size Width="4096" Height="4096"/>
    </Image>
*/
std::string BuildDziDescriptor(const TilePyramid& pyramid);

} // namespace masterplan::tiling
