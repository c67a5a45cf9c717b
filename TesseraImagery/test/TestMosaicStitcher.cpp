#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/MosaicStitcher.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraImagery/TileGridBuilder.h>
#include <TesseraImagery/TileUrlStrategy.h>
#include <TesseraUtility/CodedError.h>

#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace TesseraGeometry;
using namespace TesseraGeospatial;
using namespace TesseraImagery;
using namespace TesseraUtility;

namespace {
ImageAsset createSolidTile(int32_t size, int32_t channels, uint8_t value) {
  ImageAsset tile(size, size, channels);
  for (size_t i = 0; i < tile.pixelData.size(); ++i) {
    tile.pixelData[i] =
        (channels == 4 && i % 4 == 3) ? std::byte(255) : std::byte(value);
  }
  return tile;
}

std::byte
pixelAt(const ImageAsset& image, int32_t x, int32_t y, int32_t channel) {
  return image.pixelData
      [(size_t(y) * size_t(image.width) + size_t(x)) * size_t(image.channels) +
       size_t(channel)];
}

TileGrid createGrid(const TileRange& range) {
  return TileGridBuilder::build(
      range,
      TileUrlStrategy::create(EsriOptions{}));
}
} // namespace

TEST_CASE("MosaicStitcher::stitch") {
  const TileGrid grid = createGrid(TileRange{5, 10, 11, 12, 12});
  REQUIRE(grid.getColumns() == 3);
  REQUIRE(grid.getRows() == 2);

  std::vector<ImageAsset> tiles;
  for (uint8_t i = 0; i < 6; ++i) {
    tiles.emplace_back(createSolidTile(4, 4, uint8_t(10 * (i + 1))));
  }

  SUBCASE("places each tile at its grid offset") {
    StitchedMosaic mosaic = MosaicStitcher::stitch(grid, tiles);
    CHECK(mosaic.image.width == 12);
    CHECK(mosaic.image.height == 8);
    CHECK(mosaic.image.channels == 3);
    CHECK(mosaic.image.pixelData.size() == 12 * 8 * 3);

    for (int32_t row = 0; row < 2; ++row) {
      for (int32_t column = 0; column < 3; ++column) {
        const std::byte expected = std::byte(10 * (row * 3 + column + 1));
        CHECK(pixelAt(mosaic.image, column * 4, row * 4, 0) == expected);
        CHECK(pixelAt(mosaic.image, column * 4 + 3, row * 4 + 3, 2) == expected);
      }
    }
  }

  SUBCASE("combines the tile footprints") {
    StitchedMosaic mosaic = MosaicStitcher::stitch(grid, tiles);
    const Bounds& northwest = grid.getCell(0, 0).bounds;
    const Bounds& southeast = grid.getCell(1, 2).bounds;
    CHECK(mosaic.bounds.getWest() == northwest.getWest());
    CHECK(mosaic.bounds.getNorth() == northwest.getNorth());
    CHECK(mosaic.bounds.getEast() == southeast.getEast());
    CHECK(mosaic.bounds.getSouth() == southeast.getSouth());
    CHECK(mosaic.bounds == grid.computeBounds());
  }

  SUBCASE("keeps alpha when four channels are requested") {
    StitchedMosaic mosaic = MosaicStitcher::stitch(grid, tiles, 4);
    CHECK(mosaic.image.channels == 4);
    CHECK(pixelAt(mosaic.image, 5, 5, 3) == std::byte(255));
  }

  SUBCASE("resamples tiles of a different size") {
    tiles[4] = createSolidTile(8, 4, 200);
    StitchedMosaic mosaic = MosaicStitcher::stitch(grid, tiles);
    CHECK(mosaic.image.width == 12);
    CHECK(mosaic.image.height == 8);
    CHECK(pixelAt(mosaic.image, 5, 5, 0) == std::byte(200));
  }

  SUBCASE("rejects tiles whose channels cannot be converted") {
    tiles[2] = createSolidTile(4, 1, 0);
    try {
      MosaicStitcher::stitch(grid, tiles);
      FAIL("Expected a ChannelMismatch error");
    } catch (const CodedError& e) {
      CHECK(e.code() == ErrorCode::ChannelMismatch);
    }
  }

  SUBCASE("rejects the wrong number of tiles") {
    tiles.pop_back();
    CHECK_THROWS_AS(MosaicStitcher::stitch(grid, tiles), CodedError);
  }
}

TEST_CASE("MosaicStitcher output is square for a square range") {
  const TileGrid grid = createGrid(TileRange{4, 2, 2, 4, 4});
  std::vector<ImageAsset> tiles(9, createSolidTile(2, 4, 1));
  StitchedMosaic mosaic = MosaicStitcher::stitch(grid, tiles);
  CHECK(mosaic.image.width == mosaic.image.height);
}
