#pragma once

#include <arrow/buffer.h>

#include <functional>
#include <string>

#include "internal/runtime/cancellation.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/tiling/tile_pyramid.hpp"

namespace masterplan::tiling {

// Percent in [0, 100]; called once per completed level.
using ProgressCallback = std::function<void(int percent)>;

/*
  Builds a tile pyramid from one encoded source raster.

  Levels are produced finest-first: the full-resolution level is sliced
  first, then each coarser level is box-filtered from the previous one.
  Tile encoding within a level runs on the encode pool; levels are
  sequential.

  Nothing is left under the sink prefix when Generate throws.
*/
class TilePyramidGenerator {
 public:
  explicit TilePyramidGenerator(runtime::WorkerPool& encode_pool);

  // Throws util::ValidationError listing every bad option.
  static void ValidateOptions(const TileOptions& options);

  TilePyramid Generate(const arrow::Buffer& source, const TileOptions& options, storage::BlobStore& sink, const std::string& prefix,
                       const ProgressCallback& progress = {}, const runtime::CancellationToken* cancel = nullptr);

 private:
  int64_t WriteLevel(const imaging::RasterImage& image, const PyramidPlan& plan, const LevelPlan& level, const TileOptions& options,
                     storage::BlobStore& sink, const std::string& prefix);

  runtime::WorkerPool& encode_pool_;
};

} // namespace masterplan::tiling
