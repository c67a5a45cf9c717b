#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/TileCoordinateMapper.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraImagery/TileGridBuilder.h>
#include <TesseraImagery/TileUrlStrategy.h>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

using namespace TesseraGeometry;
using namespace TesseraGeospatial;

namespace TesseraImagery {

/*static*/ TileGrid TileGridBuilder::build(
    const TileRange& range,
    const TileUrlStrategy& strategy,
    const TileUrlContext& context) {
  std::vector<TileGridCell> cells;
  if (range.getTileCount() > 0) {
    cells.reserve(size_t(range.getTileCount()));
  }

  for (int32_t y = range.minimumY; y <= range.maximumY; ++y) {
    for (int32_t x = range.minimumX; x <= range.maximumX; ++x) {
      const TileCoord coord(x, y, range.z);
      cells.emplace_back(TileGridCell{
          coord,
          strategy.getTileUrl(coord, context),
          TileCoordinateMapper::tileToBounds(coord)});
    }
  }

  return TileGrid(range, std::move(cells));
}

} // namespace TesseraImagery
