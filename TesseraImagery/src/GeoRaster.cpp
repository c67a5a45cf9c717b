#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoTransform.h>
#include <TesseraImagery/GeoRaster.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/ImageManipulation.h>
#include <TesseraUtility/CodedError.h>

#include <fmt/format.h>
#include <glm/vec2.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace TesseraGeospatial;
using namespace TesseraUtility;

namespace TesseraImagery {

GeoRaster::GeoRaster(
    ImageAsset&& image,
    const Bounds& bounds,
    const std::string& crs)
    : _image(std::move(image)),
      _bounds(bounds),
      _transform(GeoTransform::fromBounds(
          bounds,
          this->_image.width,
          this->_image.height)),
      _crs(crs) {
  if (this->_image.width <= 0 || this->_image.height <= 0 ||
      this->_image.channels <= 0) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "A raster cannot be {}x{} pixels with {} channels.",
            this->_image.width,
            this->_image.height,
            this->_image.channels));
  }

  const size_t expectedSize =
      this->_image.getRowStride() * size_t(this->_image.height);
  if (this->_image.pixelData.size() != expectedSize) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "Expected {} bytes of pixel data but received {}.",
            expectedSize,
            this->_image.pixelData.size()));
  }
}

/*static*/ GeoRaster GeoRaster::fromImage(
    const ImageAsset& image,
    const Bounds& bounds,
    const std::string& crs) {
  ImageAsset copy = image;
  return GeoRaster(std::move(copy), bounds, crs);
}

GeoRaster GeoRaster::clone() const {
  return fromImage(this->_image, this->_bounds, this->_crs);
}

GeoRaster GeoRaster::toRgb() const {
  return GeoRaster(
      ImageManipulation::toRgb(this->_image),
      this->_bounds,
      this->_crs);
}

std::vector<std::vector<GeoRaster>> GeoRaster::toPatches(
    int32_t patchHeight,
    int32_t patchWidth,
    const PatchOptions& options) const {
  if (patchHeight <= 0 || patchWidth <= 0) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "Patch size must be positive, but is {}x{}.",
            patchWidth,
            patchHeight));
  }

  if (this->_image.channels == 2) {
    throw CodedError(
        ErrorCode::ChannelMismatch,
        "Splitting into patches is not supported for 2-channel images.");
  }

  const int32_t remainderHeight = this->_image.height % patchHeight;
  const int32_t remainderWidth = this->_image.width % patchWidth;
  const int32_t padHeight =
      remainderHeight == 0 ? 0 : patchHeight - remainderHeight;
  const int32_t padWidth =
      remainderWidth == 0 ? 0 : patchWidth - remainderWidth;

  ImageAsset padded;
  const bool pad = options.padding && (padHeight > 0 || padWidth > 0);
  if (pad) {
    padded = ImageManipulation::pad(this->_image, padWidth, padHeight);
  }
  const ImageAsset& source = pad ? padded : this->_image;

  std::vector<std::vector<GeoRaster>> patches;
  for (int32_t top = 0; top < source.height; top += patchHeight) {
    std::vector<GeoRaster>& row = patches.emplace_back();
    const int32_t bottom = std::min(top + patchHeight, source.height);

    for (int32_t left = 0; left < source.width; left += patchWidth) {
      const int32_t right = std::min(left + patchWidth, source.width);

      ImageAsset pixels = ImageManipulation::crop(
          source,
          PixelRectangle{left, top, right - left, bottom - top});

      const glm::dvec2 northwest = this->pixelToWorld(left, top);
      const glm::dvec2 southeast = this->pixelToWorld(right, bottom);

      row.emplace_back(
          std::move(pixels),
          Bounds(northwest.x, southeast.y, southeast.x, northwest.y),
          this->_crs);
    }
  }

  return patches;
}

/*static*/ GeoRaster GeoRaster::fromPatches(
    const std::vector<std::vector<GeoRaster>>& patches,
    const Bounds& bounds,
    const std::string& crs) {
  if (patches.empty() || patches.front().empty()) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        "Input patches must be a non-empty 2D array.");
  }

  const size_t columns = patches.front().size();
  const int32_t channels = patches.front().front().getChannels();

  int32_t totalWidth = 0;
  for (const GeoRaster& patch : patches.front()) {
    totalWidth += patch.getWidth();
  }

  int32_t totalHeight = 0;
  for (const std::vector<GeoRaster>& row : patches) {
    if (row.size() != columns) {
      throw CodedError(
          ErrorCode::InvalidArgument,
          fmt::format(
              "Every row of patches must have {} columns, but one has {}.",
              columns,
              row.size()));
    }
    totalHeight += row.front().getHeight();
  }

  ImageAsset merged(totalWidth, totalHeight, channels);

  int32_t top = 0;
  for (size_t i = 0; i < patches.size(); ++i) {
    int32_t left = 0;
    for (size_t j = 0; j < columns; ++j) {
      const GeoRaster& patch = patches[i][j];
      if (patch.getChannels() != channels &&
          !(patch.getChannels() == 4 && channels == 3)) {
        throw CodedError(
            ErrorCode::ChannelMismatch,
            fmt::format(
                "All patches must have the same number of channels. Row: {}, "
                "Column: {}",
                i,
                j));
      }

      const ImageAsset pixels =
          ImageManipulation::convertChannels(patch.getImage(), channels);
      const PixelRectangle rectangle{left, top, pixels.width, pixels.height};
      if (!ImageManipulation::blitImage(
              merged,
              rectangle,
              pixels,
              PixelRectangle{0, 0, pixels.width, pixels.height})) {
        throw CodedError(
            ErrorCode::InvalidArgument,
            fmt::format(
                "The patch at row {}, column {} does not fit in a {}x{} "
                "image.",
                i,
                j,
                totalWidth,
                totalHeight));
      }
      left += pixels.width;
    }
    top += patches[i].front().getHeight();
  }

  return GeoRaster(std::move(merged), bounds, crs);
}

} // namespace TesseraImagery
