#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/TileCoordinateMapper.h>
#include <TesseraGeospatial/ZoomSelector.h>
#include <TesseraUtility/CodedError.h>

#include <doctest/doctest.h>
#include <glm/vec2.hpp>

#include <cstdint>
#include <optional>
#include <string>

using namespace TesseraGeometry;
using namespace TesseraGeospatial;
using namespace TesseraUtility;

namespace {

glm::dvec2 tileCenter(int32_t x, int32_t y, int32_t z) {
  return TileCoordinateMapper::tileToBounds(TileCoord(x, y, z)).computeCenter();
}

// A box whose corners sit in the centers of two tiles, so that the range at
// that zoom is exactly the tiles between them.
Bounds boundsBetweenTiles(const TileCoord& topLeft, const TileCoord& bottomRight) {
  const glm::dvec2 northwest = tileCenter(topLeft.x, topLeft.y, topLeft.z);
  const glm::dvec2 southeast =
      tileCenter(bottomRight.x, bottomRight.y, bottomRight.z);
  return Bounds(northwest.x, southeast.y, southeast.x, northwest.y);
}

std::optional<ErrorCode> selectErrorCode(
    const ZoomSelector& selector,
    const Bounds& bounds,
    std::optional<int32_t> zoom,
    bool requiresSquare = false) {
  try {
    selector.select(bounds, zoom, requiresSquare);
  } catch (const CodedError& e) {
    return e.code();
  }
  return std::nullopt;
}

const Bounds sanFrancisco(-122.4200, 37.7740, -122.4180, 37.7760);

} // namespace

TEST_CASE("ZoomSelector with an explicit zoom") {
  ZoomSelector selector;

  SUBCASE("uses the range at that zoom") {
    const Bounds bounds =
        boundsBetweenTiles(TileCoord(655, 1582, 12), TileCoord(657, 1583, 12));
    TileRange range = selector.select(bounds, 12);
    CHECK(range.z == 12);
    CHECK(range.minimumX == 655);
    CHECK(range.maximumX == 657);
    CHECK(range.minimumY == 1582);
    CHECK(range.maximumY == 1583);
    CHECK(range.getTileCount() == 6);
  }

  SUBCASE("rejects a grid larger than the tile budget") {
    const int32_t x = 335000;
    const int32_t y = 810000;
    const Bounds bounds =
        boundsBetweenTiles(TileCoord(x, y, 21), TileCoord(x + 81, y + 81, 21));

    std::string message;
    std::optional<ErrorCode> code;
    try {
      selector.select(bounds, 21);
    } catch (const CodedError& e) {
      message = e.what();
      code = e.code();
    }
    CHECK(code == ErrorCode::TileBudgetExceeded);
    CHECK(
        message ==
        "Requested 6724 tiles, which exceeds the maximum allowed (100)");
  }

  SUBCASE("is never adjusted to fit the budget") {
    ZoomSelectorOptions options;
    options.maximumTileCount = 4;
    ZoomSelector small(options);
    const Bounds bounds =
        boundsBetweenTiles(TileCoord(10, 10, 8), TileCoord(14, 10, 8));
    CHECK(
        selectErrorCode(small, bounds, 8) == ErrorCode::TileBudgetExceeded);
    CHECK(small.select(bounds, 7).getTileCount() <= 4);
  }

  SUBCASE("rejects zoom levels outside the allowed range") {
    ZoomSelectorOptions options;
    options.minimumZoom = 5;
    options.maximumZoom = 18;
    ZoomSelector limited(options);
    CHECK(
        selectErrorCode(limited, sanFrancisco, 4) ==
        ErrorCode::InvalidArgument);
    CHECK(
        selectErrorCode(limited, sanFrancisco, 19) ==
        ErrorCode::InvalidArgument);
    CHECK(limited.select(sanFrancisco, 18).z == 18);
  }
}

TEST_CASE("ZoomSelector adaptive search") {
  ZoomSelector selector;

  SUBCASE("ends with at most a 2x2 grid") {
    TileRange range = selector.select(sanFrancisco);
    CHECK(range.getColumns() <= 2);
    CHECK(range.getRows() <= 2);
    CHECK(range.z > 10);
    CHECK(range.z < 22);

    // One level deeper, the box would no longer fit.
    TileRange deeper =
        TileCoordinateMapper::computeTileRange(sanFrancisco, range.z + 1);
    CHECK((deeper.getColumns() > 2 || deeper.getRows() > 2));
  }

  SUBCASE("stops at the minimum zoom") {
    ZoomSelectorOptions options;
    options.minimumZoom = 3;
    options.maximumTileCount = 1000;
    ZoomSelector limited(options);

    TileRange range = limited.select(Bounds(-100.0, -60.0, 100.0, 60.0));
    CHECK(range.z == 3);
    CHECK(range.minimumX == 1);
    CHECK(range.maximumX == 6);
  }

  SUBCASE("still enforces the budget at the zoom floor") {
    ZoomSelectorOptions options;
    options.minimumZoom = 10;
    ZoomSelector limited(options);
    CHECK(
        selectErrorCode(limited, Bounds(-100.0, -60.0, 100.0, 60.0), {}) ==
        ErrorCode::TileBudgetExceeded);
  }

  SUBCASE("tile count never grows as the zoom decreases") {
    const Bounds bounds(2.2, 48.8, 2.5, 48.95);
    int64_t previous = 1;
    for (int32_t zoom = 0; zoom <= 22; ++zoom) {
      const int64_t count =
          TileCoordinateMapper::computeTileRange(bounds, zoom).getTileCount();
      CHECK(count >= previous);
      previous = count;
    }
  }
}

TEST_CASE("ZoomSelector square ranges") {
  ZoomSelector selector;

  SUBCASE("grows the shorter side") {
    const Bounds wide =
        boundsBetweenTiles(TileCoord(100, 200, 9), TileCoord(104, 201, 9));
    TileRange range = selector.select(wide, 9, true);
    CHECK(range.getColumns() == 5);
    CHECK(range.getRows() == 5);
    CHECK(range.minimumX == 100);
    CHECK(range.minimumY <= 200);
    CHECK(range.maximumY >= 201);
  }

  SUBCASE("applies to the adaptive search as well") {
    TileRange range = selector.select(Bounds(2.2, 48.8, 2.5, 48.95), {}, true);
    CHECK(range.getColumns() == range.getRows());
  }

  SUBCASE("checks the budget after squaring") {
    ZoomSelectorOptions options;
    options.maximumTileCount = 20;
    ZoomSelector small(options);
    const Bounds wide =
        boundsBetweenTiles(TileCoord(100, 200, 9), TileCoord(104, 201, 9));
    CHECK(small.select(wide, 9, false).getTileCount() == 10);
    CHECK(
        selectErrorCode(small, wide, 9, true) ==
        ErrorCode::TileBudgetExceeded);
  }
}

TEST_CASE("ZoomSelector rejects invalid input") {
  CHECK_THROWS_AS(
      ZoomSelector(ZoomSelectorOptions{100, 22, 12, 8, 2}),
      CodedError);
  CHECK_THROWS_AS(ZoomSelector(ZoomSelectorOptions{0, 22, 0, 30, 2}), CodedError);

  ZoomSelector selector;
  CHECK(
      selectErrorCode(selector, Bounds(10.0, 5.0, 5.0, 10.0), 4) ==
      ErrorCode::InvalidGeometry);
}
