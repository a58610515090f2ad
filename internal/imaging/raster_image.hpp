#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace masterplan::imaging {

enum class TileFormat { kPng, kJpeg };

// "png", "jpeg" / "jpg" (case-insensitive).
std::optional<TileFormat> ParseTileFormat(std::string_view name);

// File extension used in tile keys and in the manifest: "png" or "jpg".
std::string Extension(TileFormat format);

/*
  Decoded RGBA8 raster.

  Pixels are row-major, 4 bytes per pixel, no row padding.
*/
class RasterImage {
 public:
  RasterImage() = default;
  RasterImage(int width, int height);
  RasterImage(int width, int height, std::vector<uint8_t> pixels);

  // Throws util::SourceAssetError on unreadable or corrupt data.
  static RasterImage Decode(const arrow::Buffer& encoded);

  int Width() const {
    return width_;
  }
  int Height() const {
    return height_;
  }
  bool Empty() const {
    return width_ == 0 || height_ == 0;
  }

  const uint8_t* Data() const {
    return pixels_.data();
  }
  uint8_t* MutableData() {
    return pixels_.data();
  }

  // Anti-aliased box-filter resample.
  RasterImage Resize(int width, int height) const;

  // Copy of the [x, x+w) x [y, y+h) window; must lie inside the image.
  RasterImage Crop(int x, int y, int w, int h) const;

  std::shared_ptr<arrow::Buffer> EncodePng() const;
  std::shared_ptr<arrow::Buffer> EncodeJpeg(int quality) const;
  std::shared_ptr<arrow::Buffer> Encode(TileFormat format, int quality) const;

 private:
  int                  width_  = 0;
  int                  height_ = 0;
  std::vector<uint8_t> pixels_;
};

} // namespace masterplan::imaging
