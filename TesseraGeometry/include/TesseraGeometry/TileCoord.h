#pragma once

#include <TesseraGeometry/Library.h>

#include <cstddef>
#include <cstdint>
#include <functional>

namespace TesseraGeometry {

/**
 * @brief Identifies a single tile of a slippy-map tile pyramid.
 *
 * The row index `y` counts from the top (north) edge of the map, as in the
 * Web Mercator XYZ scheme. Providers that count rows from the bottom convert
 * with {@link TesseraGeospatial::TileCoordinateMapper::flipRowOrigin}.
 */
struct TESSERAGEOMETRY_API TileCoord final {
  /**
   * @brief Creates a new instance.
   *
   * @param x_ The column index.
   * @param y_ The row index, counted from the top.
   * @param z_ The zoom level.
   */
  constexpr TileCoord(int32_t x_, int32_t y_, int32_t z_) noexcept
      : x(x_), y(y_), z(z_) {}

  /**
   * @brief Returns `true` if two coordinates are equal.
   */
  constexpr bool operator==(const TileCoord& other) const noexcept {
    return this->x == other.x && this->y == other.y && this->z == other.z;
  }

  /**
   * @brief Returns `true` if two coordinates are *not* equal.
   */
  constexpr bool operator!=(const TileCoord& other) const noexcept {
    return !(*this == other);
  }

  /**
   * @brief Gets the number of tiles along each axis at a zoom level, 2^z.
   */
  static constexpr int64_t tilesAtZoom(int32_t z) noexcept {
    return int64_t(1) << z;
  }

  /**
   * @brief Returns `true` if the zoom is in [0, 30] and both indices are in
   * [0, 2^z).
   */
  constexpr bool isValid() const noexcept {
    if (this->z < 0 || this->z > 30) {
      return false;
    }
    const int64_t n = tilesAtZoom(this->z);
    return this->x >= 0 && this->y >= 0 && this->x < n && this->y < n;
  }

  /**
   * @brief The column index.
   */
  int32_t x;

  /**
   * @brief The row index, counted from the top.
   */
  int32_t y;

  /**
   * @brief The zoom level.
   */
  int32_t z;
};

} // namespace TesseraGeometry

namespace std {

/**
 * @brief A hash function for {@link TesseraGeometry::TileCoord} objects.
 */
template <> struct hash<TesseraGeometry::TileCoord> {
  /**
   * @brief A specialization of the `std::hash` template for
   * {@link TesseraGeometry::TileCoord} objects.
   */
  size_t operator()(const TesseraGeometry::TileCoord& key) const noexcept;
};
} // namespace std
