#include "raster_image.hpp"

#include <stb_image.h>
#include <stb_image_resize2.h>
#include <stb_image_write.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <new>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace masterplan::imaging {

namespace {

constexpr int kChannels = 4;

void AppendToString(void* context, void* data, int size) {
  auto* out = static_cast<std::string*>(context);
  out->append(static_cast<const char*>(data), static_cast<size_t>(size));
}

} // namespace

std::optional<TileFormat> ParseTileFormat(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "png") return TileFormat::kPng;
  if (lower == "jpeg" || lower == "jpg") return TileFormat::kJpeg;
  return std::nullopt;
}

std::string Extension(TileFormat format) {
  switch (format) {
    case TileFormat::kPng:
      return "png";
    case TileFormat::kJpeg:
      return "jpg";
  }
  throw std::invalid_argument("unknown tile format");
}

RasterImage::RasterImage(int width, int height)
    : width_(width), height_(height), pixels_(static_cast<size_t>(width) * static_cast<size_t>(height) * kChannels, 0) {
}

RasterImage::RasterImage(int width, int height, std::vector<uint8_t> pixels) : width_(width), height_(height), pixels_(std::move(pixels)) {
  if (pixels_.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * kChannels) {
    throw std::invalid_argument("pixel buffer does not match image dimensions");
  }
}

RasterImage RasterImage::Decode(const arrow::Buffer& encoded) {
  if (encoded.size() == 0) {
    throw util::SourceAssetError("source image is empty");
  }
  if (encoded.size() > std::numeric_limits<int>::max()) {
    throw util::SourceAssetError("source image exceeds 2 GiB");
  }

  const auto* data = encoded.data();
  const int   size = static_cast<int>(encoded.size());

  int width = 0, height = 0, components = 0;
  if (!stbi_info_from_memory(data, size, &width, &height, &components)) {
    throw util::SourceAssetError(std::string("unreadable source image: ") + stbi_failure_reason());
  }

  // stb has no sequential decode; the whole raster is held in memory
  unsigned char* raw = stbi_load_from_memory(data, size, &width, &height, &components, kChannels);
  if (!raw) {
    throw util::SourceAssetError(std::string("failed to decode source image: ") + stbi_failure_reason());
  }

  try {
    const size_t         bytes = static_cast<size_t>(width) * static_cast<size_t>(height) * kChannels;
    std::vector<uint8_t> pixels(raw, raw + bytes);
    stbi_image_free(raw);
    return RasterImage(width, height, std::move(pixels));
  } catch (const std::bad_alloc&) {
    stbi_image_free(raw);
    throw util::SourceAssetError("source image " + std::to_string(width) + "x" + std::to_string(height) + " does not fit in memory");
  }
}

RasterImage RasterImage::Resize(int width, int height) const {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("resize target must be positive");
  }
  if (width == width_ && height == height_) {
    return *this;
  }

  RasterImage out(width, height);
  if (!stbir_resize(pixels_.data(), width_, height_, width_ * kChannels, out.pixels_.data(), width, height, width * kChannels, STBIR_RGBA,
                    STBIR_TYPE_UINT8, STBIR_EDGE_CLAMP, STBIR_FILTER_BOX)) {
    throw std::runtime_error("image resize failed");
  }
  return out;
}

RasterImage RasterImage::Crop(int x, int y, int w, int h) const {
  if (x < 0 || y < 0 || w <= 0 || h <= 0 || x + w > width_ || y + h > height_) {
    throw std::out_of_range("crop window outside image");
  }

  RasterImage  out(w, h);
  const size_t row_bytes = static_cast<size_t>(w) * kChannels;
  for (int row = 0; row < h; ++row) {
    const auto* src = pixels_.data() + (static_cast<size_t>(y + row) * width_ + x) * kChannels;
    std::memcpy(out.pixels_.data() + static_cast<size_t>(row) * row_bytes, src, row_bytes);
  }
  return out;
}

std::shared_ptr<arrow::Buffer> RasterImage::EncodePng() const {
  std::string out;
  if (stbi_write_png_to_func(AppendToString, &out, width_, height_, kChannels, pixels_.data(), width_ * kChannels) == 0) {
    throw std::runtime_error("PNG encode failed");
  }
  return storage::common::BufferFromString(std::move(out));
}

std::shared_ptr<arrow::Buffer> RasterImage::EncodeJpeg(int quality) const {
  std::string out;
  // the JPEG writer drops the alpha channel
  if (stbi_write_jpg_to_func(AppendToString, &out, width_, height_, kChannels, pixels_.data(), quality) == 0) {
    throw std::runtime_error("JPEG encode failed");
  }
  return storage::common::BufferFromString(std::move(out));
}

std::shared_ptr<arrow::Buffer> RasterImage::Encode(TileFormat format, int quality) const {
  switch (format) {
    case TileFormat::kPng:
      return EncodePng();
    case TileFormat::kJpeg:
      return EncodeJpeg(quality);
  }
  throw std::invalid_argument("unknown tile format");
}

} // namespace masterplan::imaging
