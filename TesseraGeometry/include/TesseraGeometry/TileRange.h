#pragma once

#include <TesseraGeometry/Library.h>
#include <TesseraGeometry/TileCoord.h>

#include <cstdint>

namespace TesseraGeometry {

/**
 * @brief A rectangular range of tiles at a single zoom level. Both corners
 * are *inclusive*.
 */
struct TESSERAGEOMETRY_API TileRange final {
  /**
   * @brief The zoom level of every tile in the range.
   */
  int32_t z;

  /**
   * @brief The minimum column index, *inclusive*.
   */
  int32_t minimumX;

  /**
   * @brief The minimum row index, *inclusive*. This is the northernmost row.
   */
  int32_t minimumY;

  /**
   * @brief The maximum column index, *inclusive*.
   */
  int32_t maximumX;

  /**
   * @brief The maximum row index, *inclusive*. This is the southernmost row.
   */
  int32_t maximumY;

  /**
   * @brief Creates the range spanned by two tiles at the same zoom level.
   *
   * The corners may be given in any order.
   */
  static TileRange fromCorners(const TileCoord& a, const TileCoord& b) noexcept;

  /** @brief Gets the number of columns in the range. */
  constexpr int32_t getColumns() const noexcept {
    return this->maximumX - this->minimumX + 1;
  }

  /** @brief Gets the number of rows in the range. */
  constexpr int32_t getRows() const noexcept {
    return this->maximumY - this->minimumY + 1;
  }

  /** @brief Gets the total number of tiles in the range. */
  constexpr int64_t getTileCount() const noexcept {
    return int64_t(this->getColumns()) * int64_t(this->getRows());
  }

  /**
   * @brief Determines if a tile lies inside this range.
   */
  constexpr bool contains(const TileCoord& coord) const noexcept {
    return coord.z == this->z && coord.x >= this->minimumX &&
           coord.x <= this->maximumX && coord.y >= this->minimumY &&
           coord.y <= this->maximumY;
  }

  /**
   * @brief Grows the shorter side of the range until it has as many tiles as
   * the longer side.
   *
   * Tiles are added evenly on both sides of the shorter axis. When one side
   * reaches the edge of the map, the remaining tiles are added on the other
   * side. The result is square unless the map at this zoom level has fewer
   * tiles along an axis than the longer side of the range.
   *
   * @return The squared range.
   */
  TileRange expandToSquare() const noexcept;

  constexpr bool operator==(const TileRange& other) const noexcept {
    return this->z == other.z && this->minimumX == other.minimumX &&
           this->minimumY == other.minimumY &&
           this->maximumX == other.maximumX && this->maximumY == other.maximumY;
  }
};

} // namespace TesseraGeometry
