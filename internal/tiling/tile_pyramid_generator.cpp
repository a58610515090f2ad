#include "tile_pyramid_generator.hpp"

#include <exception>
#include <future>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace masterplan::tiling {

using observability::IntField;
using observability::StringField;

masterplan::release::v1::TileConfig TilePyramid::ToTileConfig() const {
  masterplan::release::v1::TileConfig tiles;
  tiles.set_format(Extension());
  tiles.set_tile_size(plan.tile_size);
  tiles.set_overlap(plan.overlap);
  tiles.set_levels(plan.LevelCount());
  tiles.set_width(plan.width);
  tiles.set_height(plan.height);
  tiles.set_tile_count(tile_count);
  return tiles;
}

TilePyramidGenerator::TilePyramidGenerator(runtime::WorkerPool& encode_pool) : encode_pool_(encode_pool) {
}

void TilePyramidGenerator::ValidateOptions(const TileOptions& options) {
  std::vector<std::string> errors;
  if (options.tile_size <= 0) {
    errors.push_back("tile_size must be positive");
  }
  if (options.overlap < 0 || (options.tile_size > 0 && options.overlap >= options.tile_size)) {
    errors.push_back("overlap must be in [0, tile_size)");
  }
  if (options.quality < 1 || options.quality > 100) {
    errors.push_back("quality must be in [1, 100], got " + std::to_string(options.quality));
  }
  if (!errors.empty()) {
    throw util::ValidationError(std::move(errors));
  }
}

int64_t TilePyramidGenerator::WriteLevel(const imaging::RasterImage& image, const PyramidPlan& plan, const LevelPlan& level,
                                         const TileOptions& options, storage::BlobStore& sink, const std::string& prefix) {
  const auto ext = imaging::Extension(options.format);

  std::vector<std::future<void>> pending;
  pending.reserve(static_cast<size_t>(level.TileCount()));

  for (int row = 0; row < level.rows; ++row) {
    for (int col = 0; col < level.cols; ++col) {
      pending.push_back(encode_pool_.Submit([&, col, row] {
        const auto rect = plan.TileBounds(level, col, row);
        auto       tile = image.Crop(rect.x, rect.y, rect.w, rect.h);
        sink.Put(storage::common::JoinKey(prefix, storage::common::TileKey(level.level, col, row, ext)), tile.Encode(options.format, options.quality));
      }));
    }
  }

  // every task references `image`; wait for all before reporting
  std::exception_ptr first_error;
  for (auto& f : pending) {
    try {
      f.get();
    } catch (...) {
      if (!first_error) first_error = std::current_exception();
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return level.TileCount();
}

TilePyramid TilePyramidGenerator::Generate(const arrow::Buffer& source, const TileOptions& options, storage::BlobStore& sink,
                                           const std::string& prefix, const ProgressCallback& progress,
                                           const runtime::CancellationToken* cancel) {
  ValidateOptions(options);

  auto image = imaging::RasterImage::Decode(source);

  TilePyramid pyramid;
  pyramid.plan    = PlanPyramid(image.Width(), image.Height(), options.tile_size, options.overlap);
  pyramid.options = options;
  pyramid.prefix  = prefix;

  const int levels = pyramid.plan.LevelCount();
  MASTERPLAN_LOG_INFO("tile pyramid planned", {IntField("width", image.Width()), IntField("height", image.Height()), IntField("levels", levels),
                                               IntField("tiles", pyramid.plan.TotalTiles()), StringField("prefix", prefix)});

  try {
    int completed = 0;
    for (int l = levels - 1; l >= 0; --l) {
      if (cancel) cancel->ThrowIfCancelled("tile level " + std::to_string(l));

      const auto& level = pyramid.plan.levels[l];
      if (image.Width() != level.width || image.Height() != level.height) {
        image = image.Resize(level.width, level.height);
      }

      pyramid.tile_count += WriteLevel(image, pyramid.plan, level, options, sink, prefix);
      ++completed;

      MASTERPLAN_LOG_DEBUG("tile level written", {IntField("level", l), IntField("cols", level.cols), IntField("rows", level.rows)});
      if (progress) {
        progress(completed * 100 / levels);
      }
    }
  } catch (...) {
    try {
      sink.RemovePrefix(prefix);
    } catch (const std::exception& e) {
      MASTERPLAN_LOG_WARN("failed to remove partial pyramid", {StringField("prefix", prefix), StringField("error", e.what())});
    }
    throw;
  }

  return pyramid;
}

} // namespace masterplan::tiling
