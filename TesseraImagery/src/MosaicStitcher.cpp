#include <TesseraGeospatial/Bounds.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/ImageManipulation.h>
#include <TesseraImagery/MosaicStitcher.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraUtility/CodedError.h>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace TesseraGeospatial;
using namespace TesseraUtility;

namespace TesseraImagery {

/*static*/ StitchedMosaic MosaicStitcher::stitch(
    const TileGrid& grid,
    const std::vector<ImageAsset>& tiles,
    int32_t channels) {
  const std::vector<TileGridCell>& cells = grid.getCells();
  if (tiles.size() != cells.size()) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "Expected {} tiles for a {}x{} grid but received {}.",
            cells.size(),
            grid.getColumns(),
            grid.getRows(),
            tiles.size()));
  }

  const int32_t tileWidth = tiles.front().width;
  const int32_t tileHeight = tiles.front().height;
  if (tileWidth <= 0 || tileHeight <= 0) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "The first tile has an empty size of {}x{} pixels.",
            tileWidth,
            tileHeight));
  }

  StitchedMosaic result{
      ImageAsset(
          grid.getColumns() * tileWidth,
          grid.getRows() * tileHeight,
          channels),
      cells.front().bounds};

  for (size_t i = 0; i < tiles.size(); ++i) {
    const int32_t row = int32_t(i / size_t(grid.getColumns()));
    const int32_t column = int32_t(i % size_t(grid.getColumns()));

    const ImageAsset tile =
        ImageManipulation::convertChannels(tiles[i], channels);
    const bool copied = ImageManipulation::blitImage(
        result.image,
        PixelRectangle{
            column * tileWidth,
            row * tileHeight,
            tileWidth,
            tileHeight},
        tile,
        PixelRectangle{0, 0, tile.width, tile.height});
    if (!copied) {
      throw CodedError(
          ErrorCode::InvalidArgument,
          fmt::format(
              "Tile {}/{}/{} with {}x{} pixels could not be placed in the "
              "mosaic.",
              cells[i].coord.z,
              cells[i].coord.x,
              cells[i].coord.y,
              tile.width,
              tile.height));
    }

    result.bounds = result.bounds.computeUnion(cells[i].bounds);
  }

  return result;
}

} // namespace TesseraImagery
