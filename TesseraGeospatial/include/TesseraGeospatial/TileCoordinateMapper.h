#pragma once

#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/Library.h>

#include <cstdint>

namespace TesseraGeospatial {

/**
 * @brief Converts between longitude/latitude and Web Mercator (XYZ) tile
 * indices.
 */
class TESSERAGEOSPATIAL_API TileCoordinateMapper final {
public:
  /**
   * @brief The largest latitude representable in Web Mercator, in degrees.
   */
  static constexpr double MAXIMUM_LATITUDE = 85.0511287798;

  /**
   * @brief Computes the tile containing a position.
   *
   * The latitude is clamped to ±{@link MAXIMUM_LATITUDE} and the resulting
   * indices to [0, 2^zoom - 1], so longitude 180 and the poles map to the
   * edge tiles.
   *
   * @param longitude The longitude in degrees.
   * @param latitude The latitude in degrees.
   * @param zoom The zoom level.
   */
  static TesseraGeometry::TileCoord
  lonLatToTile(double longitude, double latitude, int32_t zoom) noexcept;

  /**
   * @brief Computes the longitude/latitude rectangle covered by a tile.
   */
  static Bounds tileToBounds(const TesseraGeometry::TileCoord& coord) noexcept;

  /**
   * @brief Converts a row index between top-left and bottom-left origin,
   * `2^zoom - 1 - y`. Applying it twice returns the original row.
   */
  static constexpr int32_t flipRowOrigin(int32_t y, int32_t zoom) noexcept {
    return static_cast<int32_t>(
        TesseraGeometry::TileCoord::tilesAtZoom(zoom) - 1 - y);
  }

  /**
   * @brief Computes the range of tiles at a zoom level that covers a
   * rectangle: the top-left tile contains (west, north) and the bottom-right
   * tile contains (east, south).
   */
  static TesseraGeometry::TileRange
  computeTileRange(const Bounds& bounds, int32_t zoom) noexcept;
};

} // namespace TesseraGeospatial
