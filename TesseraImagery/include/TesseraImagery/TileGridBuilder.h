#pragma once

#include <TesseraGeometry/TileRange.h>
#include <TesseraImagery/Library.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraImagery/TileUrlStrategy.h>

namespace TesseraImagery {

/**
 * @brief Enumerates the tiles of a range and the URL of each.
 */
class TESSERAIMAGERY_API TileGridBuilder final {
public:
  /**
   * @brief Builds the grid covering a range.
   *
   * @param range The tiles to include.
   * @param strategy Builds each tile's URL.
   * @param context Extra parameters passed to the strategy for every tile.
   */
  static TileGrid build(
      const TesseraGeometry::TileRange& range,
      const TileUrlStrategy& strategy,
      const TileUrlContext& context = {});
};

} // namespace TesseraImagery
