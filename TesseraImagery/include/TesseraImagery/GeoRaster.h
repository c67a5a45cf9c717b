#pragma once

#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoTransform.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/Library.h>

#include <glm/vec2.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace TesseraImagery {

/**
 * @brief Options for {@link GeoRaster::toPatches}.
 */
struct TESSERAIMAGERY_API PatchOptions {
  /**
   * @brief Whether to pad the raster with zeros on the right and bottom so
   * that every patch has the requested size. Without padding, the patches in
   * the last column and row are smaller.
   */
  bool padding = true;
};

/**
 * @brief An 8-bit image whose pixels are tied to longitude/latitude by an
 * affine {@link TesseraGeospatial::GeoTransform}.
 *
 * The transform is always derived from the bounds and the image size, with
 * pixel (0, 0) at the northwest corner. Instances can be moved but not
 * copied; use {@link clone} for an explicit deep copy.
 */
class TESSERAIMAGERY_API GeoRaster final {
public:
  /**
   * @brief The coordinate reference system used when none is given.
   */
  static constexpr const char* DEFAULT_CRS = "EPSG:4326";

  /**
   * @brief Creates a raster that takes ownership of an image.
   *
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * the image is empty or its pixel data does not match its size.
   */
  GeoRaster(
      ImageAsset&& image,
      const TesseraGeospatial::Bounds& bounds,
      const std::string& crs = DEFAULT_CRS);

  GeoRaster(GeoRaster&& rhs) noexcept = default;
  GeoRaster& operator=(GeoRaster&& rhs) noexcept = default;
  GeoRaster(const GeoRaster& rhs) = delete;
  GeoRaster& operator=(const GeoRaster& rhs) = delete;

  /**
   * @brief Creates a raster from a copy of an image.
   */
  static GeoRaster fromImage(
      const ImageAsset& image,
      const TesseraGeospatial::Bounds& bounds,
      const std::string& crs = DEFAULT_CRS);

  /**
   * @brief Creates a deep copy of this raster.
   */
  GeoRaster clone() const;

  /**
   * @brief Gets the rectangle covered by the raster.
   */
  const TesseraGeospatial::Bounds& getBounds() const noexcept {
    return this->_bounds;
  }

  /**
   * @brief Gets the coordinate reference system, such as `EPSG:4326`.
   */
  const std::string& getCRS() const noexcept { return this->_crs; }

  /**
   * @brief Gets the transform from pixel to world coordinates.
   */
  const TesseraGeospatial::GeoTransform& getTransform() const noexcept {
    return this->_transform;
  }

  int32_t getWidth() const noexcept { return this->_image.width; }

  int32_t getHeight() const noexcept { return this->_image.height; }

  int32_t getChannels() const noexcept { return this->_image.channels; }

  /**
   * @brief Gets the pixels.
   */
  const ImageAsset& getImage() const noexcept { return this->_image; }

  /**
   * @brief Converts a pixel position to longitude/latitude.
   */
  glm::dvec2 pixelToWorld(double x, double y) const noexcept {
    return this->_transform.pixelToWorld(x, y);
  }

  /**
   * @brief Converts longitude/latitude to the nearest pixel position.
   *
   * @throws TesseraUtility::CodedError with `ErrorCode::DegenerateTransform`
   * if the transform cannot be inverted.
   */
  glm::ivec2 worldToPixel(double longitude, double latitude) const {
    return this->_transform.worldToPixel(longitude, latitude);
  }

  /**
   * @brief Creates a 3-channel copy of this raster. Alpha is dropped and gray
   * values are replicated.
   */
  GeoRaster toRgb() const;

  /**
   * @brief Splits the raster into a grid of patches.
   *
   * Each patch's bounds are computed by mapping the pixel corners of the
   * patch through this raster's transform, so padded patches extend past
   * this raster's bounds.
   *
   * @param patchHeight The height of each patch, in pixels.
   * @param patchWidth The width of each patch, in pixels.
   * @param options The options.
   * @return The patches, one inner vector per row, north first.
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * a patch size is not positive, or `ErrorCode::ChannelMismatch` if the
   * raster has 2 channels.
   */
  std::vector<std::vector<GeoRaster>> toPatches(
      int32_t patchHeight,
      int32_t patchWidth,
      const PatchOptions& options = {}) const;

  /**
   * @brief Joins a grid of patches into a single raster.
   *
   * The output has the channel count of the first patch; 4-channel patches
   * are reduced to 3 channels when the first patch has 3. Its width is the
   * sum of the first row's widths and its height the sum of the first
   * column's heights.
   *
   * @param patches The patches, one inner vector per row, north first.
   * @param bounds The bounds of the joined raster.
   * @param crs The coordinate reference system of the joined raster.
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * the grid is empty or not rectangular, or `ErrorCode::ChannelMismatch`
   * if a patch's channels cannot be converted.
   */
  static GeoRaster fromPatches(
      const std::vector<std::vector<GeoRaster>>& patches,
      const TesseraGeospatial::Bounds& bounds,
      const std::string& crs = DEFAULT_CRS);

private:
  ImageAsset _image;
  TesseraGeospatial::Bounds _bounds;
  TesseraGeospatial::GeoTransform _transform;
  std::string _crs;
};

} // namespace TesseraImagery
