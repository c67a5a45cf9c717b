#pragma once

#include <TesseraGeospatial/Bounds.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/Library.h>
#include <TesseraImagery/TileGrid.h>

#include <cstdint>
#include <vector>

namespace TesseraImagery {

/**
 * @brief A single image assembled from the tiles of a {@link TileGrid}.
 */
struct TESSERAIMAGERY_API StitchedMosaic {
  /**
   * @brief The assembled pixels.
   */
  ImageAsset image;

  /**
   * @brief The rectangle covered by the image, the union of the tiles'
   * footprints.
   */
  TesseraGeospatial::Bounds bounds;
};

/**
 * @brief Assembles decoded tiles into one image.
 */
class TESSERAIMAGERY_API MosaicStitcher final {
public:
  /**
   * @brief Copies each tile to its offset in the grid.
   *
   * The cell size is the size of the first tile; other tiles with a
   * different size are resampled to fit their cell. The output is
   * `columns * cellWidth` pixels wide and `rows * cellHeight` pixels high.
   *
   * @param grid The grid the tiles were fetched for.
   * @param tiles The decoded tiles in the grid's row-major order.
   * @param channels The number of channels of the output. A 4-channel tile is
   * reduced to 3 channels by dropping alpha.
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * the number of tiles does not match the grid or the first tile is empty,
   * or `ErrorCode::ChannelMismatch` if a tile cannot be converted to
   * `channels` channels.
   */
  static StitchedMosaic stitch(
      const TileGrid& grid,
      const std::vector<ImageAsset>& tiles,
      int32_t channels = 3);
};

} // namespace TesseraImagery
