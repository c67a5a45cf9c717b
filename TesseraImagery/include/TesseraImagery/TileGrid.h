#pragma once

#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraImagery/Library.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace TesseraImagery {

/**
 * @brief A tile to download as part of a {@link TileGrid}.
 */
struct TESSERAIMAGERY_API TileGridCell {
  /**
   * @brief The tile's coordinate.
   */
  TesseraGeometry::TileCoord coord;

  /**
   * @brief The URL from which to download the tile.
   */
  std::string url;

  /**
   * @brief The longitude/latitude rectangle covered by the tile.
   */
  TesseraGeospatial::Bounds bounds;
};

/**
 * @brief The tiles covering a {@link TesseraGeometry::TileRange}, stored
 * row-major with the northernmost row and westernmost column first.
 */
class TESSERAIMAGERY_API TileGrid final {
public:
  /**
   * @brief Creates a grid from its cells.
   *
   * @param range The range the grid covers.
   * @param cells The cells in row-major order. There must be exactly
   * `range.getTileCount()` of them.
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * the number of cells does not match the range.
   */
  TileGrid(
      const TesseraGeometry::TileRange& range,
      std::vector<TileGridCell>&& cells);

  /**
   * @brief Gets the range covered by this grid.
   */
  const TesseraGeometry::TileRange& getRange() const noexcept {
    return this->_range;
  }

  /** @brief Gets the zoom level of the tiles. */
  int32_t getZoom() const noexcept { return this->_range.z; }

  /** @brief Gets the number of columns. */
  int32_t getColumns() const noexcept { return this->_range.getColumns(); }

  /** @brief Gets the number of rows. */
  int32_t getRows() const noexcept { return this->_range.getRows(); }

  /**
   * @brief Gets all cells in row-major order.
   */
  const std::vector<TileGridCell>& getCells() const noexcept {
    return this->_cells;
  }

  /**
   * @brief Gets the cell at a row and column, both counted from the
   * northwest corner.
   */
  const TileGridCell& getCell(int32_t row, int32_t column) const {
    return this->_cells[size_t(row) * size_t(this->getColumns()) +
                        size_t(column)];
  }

  /**
   * @brief Computes the rectangle covered by the whole grid, the union of the
   * northwest and southeast tiles.
   */
  TesseraGeospatial::Bounds computeBounds() const noexcept;

  /**
   * @brief Creates one polygon feature per tile outlining its footprint.
   *
   * Each feature has a `tileCoords` property of the form `"z/x/y"` and a
   * `tileUrl` property.
   */
  std::vector<TesseraGeospatial::GeoJsonFeature> toFeatures() const;

private:
  TesseraGeometry::TileRange _range;
  std::vector<TileGridCell> _cells;
};

} // namespace TesseraImagery
