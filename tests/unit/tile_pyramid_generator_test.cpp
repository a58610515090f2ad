#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/imaging/raster_image.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/tiling/dzi.hpp"
#include "internal/tiling/tile_pyramid_generator.hpp"
#include "internal/util/errors.hpp"

namespace {

using masterplan::imaging::RasterImage;
using masterplan::imaging::TileFormat;
using masterplan::runtime::CancellationToken;
using masterplan::runtime::WorkerPool;
using masterplan::storage::RamBlobStore;
using masterplan::tiling::TileOptions;
using masterplan::tiling::TilePyramidGenerator;

std::shared_ptr<arrow::Buffer> GradientPng(int width, int height) {
  RasterImage image(width, height);
  auto*       px = image.MutableData();
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      auto* p = px + (static_cast<size_t>(y) * width + x) * 4;
      p[0]    = static_cast<uint8_t>(x % 256);
      p[1]    = static_cast<uint8_t>(y % 256);
      p[2]    = 128;
      p[3]    = 255;
    }
  }
  return image.EncodePng();
}

void TestGeneratesEveryTileOfEveryLevel() {
  WorkerPool pool("encode-test", 4);
  pool.Start();

  RamBlobStore sink;
  const auto   source = GradientPng(600, 300);

  TileOptions options;
  options.tile_size = 256;

  std::vector<int>     progress;
  TilePyramidGenerator generator(pool);
  const auto pyramid = generator.Generate(*source, options, sink, "jobs/j1/tiles", [&](int percent) { progress.push_back(percent); });

  assert(pyramid.plan.LevelCount() == 3);
  assert(pyramid.tile_count == pyramid.plan.TotalTiles());
  assert(static_cast<int64_t>(sink.List("jobs/j1/tiles").size()) == pyramid.tile_count);

  // one callback per level, floor((done / levels) * 100)
  assert((progress == std::vector<int>{33, 66, 100}));

  assert(sink.Exists("jobs/j1/tiles/0/0_0.png"));
  assert(sink.Exists("jobs/j1/tiles/2/2_1.png"));
  assert(!sink.Exists("jobs/j1/tiles/2/3_0.png"));

  // the last column and row are clipped, not padded
  const auto edge = RasterImage::Decode(*sink.Read("jobs/j1/tiles/2/2_1.png"));
  assert(edge.Width() == 88 && edge.Height() == 44);

  const auto coarsest = RasterImage::Decode(*sink.Read("jobs/j1/tiles/0/0_0.png"));
  assert(coarsest.Width() == 150 && coarsest.Height() == 75);

  pool.Stop();
}

void TestOverlapExtendsInteriorTiles() {
  WorkerPool pool("encode-test", 2);
  pool.Start();

  RamBlobStore sink;
  TileOptions  options;
  options.tile_size = 256;
  options.overlap   = 1;

  TilePyramidGenerator generator(pool);
  const auto           pyramid = generator.Generate(*GradientPng(512, 256), options, sink, "out");
  assert(pyramid.plan.LevelCount() == 2);

  const auto left  = RasterImage::Decode(*sink.Read("out/1/0_0.png"));
  const auto right = RasterImage::Decode(*sink.Read("out/1/1_0.png"));
  assert(left.Width() == 257 && left.Height() == 256);
  assert(right.Width() == 257 && right.Height() == 256);

  pool.Stop();
}

void TestJpegTilesUseJpgExtension() {
  WorkerPool pool("encode-test", 2);
  pool.Start();

  RamBlobStore sink;
  TileOptions  options;
  options.tile_size = 128;
  options.format    = TileFormat::kJpeg;
  options.quality   = 80;

  TilePyramidGenerator generator(pool);
  const auto           pyramid = generator.Generate(*GradientPng(128, 128), options, sink, "out");
  assert(pyramid.Extension() == "jpg");
  assert(sink.Exists("out/0/0_0.jpg"));

  const auto tiles = pyramid.ToTileConfig();
  assert(tiles.format() == "jpg");
  assert(tiles.levels() == 1);
  assert(tiles.tile_count() == 1);

  const auto dzi = masterplan::tiling::BuildDziDescriptor(pyramid);
  assert(dzi.find("TileSize=\"128\"") != std::string::npos);
  assert(dzi.find("Format=\"jpg\"") != std::string::npos);
  assert(dzi.find("Width=\"128\"") != std::string::npos);

  pool.Stop();
}

void TestCancelledRunLeavesNothingBehind() {
  WorkerPool pool("encode-test", 2);
  pool.Start();

  RamBlobStore sink;
  TileOptions  options;
  options.tile_size = 64;

  CancellationToken cancel;
  int               levels_done = 0;

  TilePyramidGenerator generator(pool);
  bool                 threw = false;
  try {
    (void)generator.Generate(
        *GradientPng(256, 256), options, sink, "jobs/j2/tiles",
        [&](int) {
          // stop after the finest level; the next level boundary notices
          if (++levels_done == 1) cancel.Cancel();
        },
        &cancel);
  } catch (const masterplan::util::Cancelled&) {
    threw = true;
  }

  assert(threw);
  assert(levels_done == 1);
  assert(sink.List("jobs/j2/tiles").empty());

  pool.Stop();
}

void TestInvalidOptionsAreAllReported() {
  TileOptions options;
  options.tile_size = 0;
  options.overlap   = -1;
  options.quality   = 101;

  bool threw = false;
  try {
    TilePyramidGenerator::ValidateOptions(options);
  } catch (const masterplan::util::ValidationError& e) {
    threw = true;
    assert(e.errors().size() == 3);
  }
  assert(threw);
}

void TestUndecodableSourceIsSourceAssetError() {
  WorkerPool pool("encode-test", 1);
  pool.Start();

  RamBlobStore         sink;
  TilePyramidGenerator generator(pool);

  bool threw = false;
  try {
    (void)generator.Generate(*masterplan::storage::common::BufferFromString("definitely not an image"), TileOptions{}, sink, "out");
  } catch (const masterplan::util::SourceAssetError&) {
    threw = true;
  }
  assert(threw);
  assert(sink.Size() == 0);

  pool.Stop();
}

} // namespace

int main() {
  TestGeneratesEveryTileOfEveryLevel();
  TestOverlapExtendsInteriorTiles();
  TestJpegTilesUseJpgExtension();
  TestCancelledRunLeavesNothingBehind();
  TestInvalidOptionsAreAllReported();
  TestUndecodableSourceIsSourceAssetError();

  std::cout << "masterplan_unit_tile_pyramid_generator: pass\n";
  return 0;
}
