#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraUtility/CodedError.h>

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace TesseraGeometry;
using namespace TesseraGeospatial;
using namespace TesseraUtility;

namespace TesseraImagery {

TileGrid::TileGrid(const TileRange& range, std::vector<TileGridCell>&& cells)
    : _range(range), _cells(std::move(cells)) {
  if (range.getColumns() <= 0 || range.getRows() <= 0 ||
      int64_t(this->_cells.size()) != range.getTileCount()) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "A {}x{} tile grid cannot be built from {} tiles.",
            range.getColumns(),
            range.getRows(),
            this->_cells.size()));
  }
}

Bounds TileGrid::computeBounds() const noexcept {
  const TileGridCell& northwest = this->_cells.front();
  const TileGridCell& southeast = this->_cells.back();
  return northwest.bounds.computeUnion(southeast.bounds);
}

std::vector<GeoJsonFeature> TileGrid::toFeatures() const {
  std::vector<GeoJsonFeature> result;
  result.reserve(this->_cells.size());

  for (const TileGridCell& cell : this->_cells) {
    GeoJsonFeature footprint;
    footprint.geometry = polygonFromBounds(cell.bounds);
    result.emplace_back(
        withProperties(footprint, [&cell](GeoJsonProperties& properties) {
          properties["tileCoords"] = fmt::format(
              "{}/{}/{}",
              cell.coord.z,
              cell.coord.x,
              cell.coord.y);
          properties["tileUrl"] = cell.url;
        }));
  }

  return result;
}

} // namespace TesseraImagery
