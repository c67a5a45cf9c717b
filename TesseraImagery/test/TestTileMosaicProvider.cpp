#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/Future.h>
#include <TesseraAsync/HttpHeaders.h>
#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraGeospatial/GeoJsonWriter.h>
#include <TesseraGeospatial/GeoTransform.h>
#include <TesseraGeospatial/TileCoordinateMapper.h>
#include <TesseraImagery/GeoRaster.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/ImageManipulation.h>
#include <TesseraImagery/TileFetcher.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraImagery/TileMosaicProvider.h>
#include <TesseraImagery/TileUrlStrategy.h>
#include <TesseraNativeTests/SimpleAssetAccessor.h>
#include <TesseraNativeTests/SimpleAssetRequest.h>
#include <TesseraNativeTests/SimpleAssetResponse.h>
#include <TesseraNativeTests/SimpleTaskProcessor.h>
#include <TesseraUtility/CodedError.h>

#include <doctest/doctest.h>
#include <glm/vec2.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace TesseraAsync;
using namespace TesseraGeometry;
using namespace TesseraGeospatial;
using namespace TesseraImagery;
using namespace TesseraNativeTests;
using namespace TesseraUtility;

namespace {

const int32_t TILE_SIZE = 4;

std::vector<std::byte> createTilePng(uint8_t value) {
  ImageAsset tile(TILE_SIZE, TILE_SIZE, 4);
  for (size_t i = 0; i < tile.pixelData.size(); ++i) {
    tile.pixelData[i] = i % 4 == 3 ? std::byte(255) : std::byte(value);
  }
  return ImageManipulation::savePng(tile);
}

std::shared_ptr<SimpleAssetRequest> createRequest(
    const std::string& url,
    uint16_t statusCode,
    const std::vector<std::byte>& data) {
  return std::make_shared<SimpleAssetRequest>(
      "GET",
      url,
      HttpHeaders{},
      std::make_unique<SimpleAssetResponse>(
          statusCode,
          "image/png",
          HttpHeaders{},
          data));
}

// Serves a PNG for every tile of the grid. The tile in row r and column c
// is filled with the value 10 * (r * columns + c + 1).
std::map<std::string, std::shared_ptr<SimpleAssetRequest>>
serveGrid(const TileGrid& grid) {
  std::map<std::string, std::shared_ptr<SimpleAssetRequest>> requests;
  for (size_t i = 0; i < grid.getCells().size(); ++i) {
    const std::string& url = grid.getCells()[i].url;
    requests[url] =
        createRequest(url, 200, createTilePng(uint8_t(10 * (i + 1))));
  }
  return requests;
}

// A polygon whose bounding box runs from the center of one tile to the
// center of another.
GeoJsonFeature polygonBetweenTiles(const TileCoord& a, const TileCoord& b) {
  const glm::dvec2 northwest =
      TileCoordinateMapper::tileToBounds(a).computeCenter();
  const glm::dvec2 southeast =
      TileCoordinateMapper::tileToBounds(b).computeCenter();
  GeoJsonFeature feature;
  feature.geometry = polygonFromBounds(
      Bounds(northwest.x, southeast.y, southeast.x, northwest.y));
  return feature;
}

std::optional<CodedError> waitForError(Future<GeoRaster>&& future) {
  try {
    future.wait();
  } catch (const CodedError& e) {
    return e;
  }
  return std::nullopt;
}

TmsOptions createTmsOptions() {
  TmsOptions options;
  options.baseUrl = "https://tiles.example.com/imagery";
  options.extension = "png";
  options.headers = {{"Referer", "https://app.example.com"}};
  return options;
}

} // namespace

TEST_CASE("TileMosaicProvider::getImage") {
  AsyncSystem asyncSystem{std::make_shared<SimpleTaskProcessor>()};

  const GeoJsonFeature polygon =
      polygonBetweenTiles(TileCoord(100, 200, 9), TileCoord(101, 201, 9));

  auto pEmptyAccessor = std::make_shared<SimpleAssetAccessor>(
      std::map<std::string, std::shared_ptr<SimpleAssetRequest>>{});
  TileMosaicProvider gridProvider(
      asyncSystem,
      pEmptyAccessor,
      createTmsOptions());
  const TileGrid grid = gridProvider.getTileGrid(polygon, {}, {}, 9);
  REQUIRE(grid.getColumns() == 2);
  REQUIRE(grid.getRows() == 2);

  SUBCASE("stitches the tiles into a georeferenced raster") {
    auto pAccessor = std::make_shared<SimpleAssetAccessor>(serveGrid(grid));
    TileMosaicProvider provider(asyncSystem, pAccessor, createTmsOptions());

    GeoRaster raster = provider.getImage(polygon, {}, {}, 9).wait();
    CHECK(raster.getWidth() == 2 * TILE_SIZE);
    CHECK(raster.getHeight() == 2 * TILE_SIZE);
    CHECK(raster.getChannels() == 3);
    CHECK(raster.getCRS() == "EPSG:4326");

    const Bounds polygonBounds = computeBounds(polygon);
    CHECK(raster.getBounds().contains(polygonBounds));
    CHECK(raster.getBounds() == grid.computeBounds());
    CHECK(
        raster.getTransform() ==
        GeoTransform::fromBounds(raster.getBounds(), 8, 8));

    // The southeast tile is the fourth one served.
    const ImageAsset& image = raster.getImage();
    const size_t southeastPixel = (size_t(7) * 8 + 7) * 3;
    CHECK(image.pixelData[southeastPixel] == std::byte(40));
    CHECK(image.pixelData[0] == std::byte(10));

    CHECK(pAccessor->requestedUrls.size() == 4);
    REQUIRE(pAccessor->lastHeaders.size() == 1);
    CHECK(pAccessor->lastHeaders[0].first == "Referer");
  }

  SUBCASE("accepts GeoJSON text") {
    auto pAccessor = std::make_shared<SimpleAssetAccessor>(serveGrid(grid));
    TileMosaicProvider provider(asyncSystem, pAccessor, createTmsOptions());

    const std::string geoJson = GeoJsonWriter::writeFeature(polygon);
    GeoRaster raster = provider.getImage(geoJson, {}, {}, 9).wait();
    CHECK(raster.getWidth() == 2 * TILE_SIZE);
    CHECK(raster.getBounds().contains(computeBounds(polygon)));
  }

  SUBCASE("chooses a zoom level when none is given") {
    TileMosaicProvider provider(asyncSystem, pEmptyAccessor, createTmsOptions());
    const TileGrid adaptiveGrid = provider.getTileGrid(polygon);
    CHECK(adaptiveGrid.getColumns() <= 2);
    CHECK(adaptiveGrid.getRows() <= 2);

    auto pAccessor =
        std::make_shared<SimpleAssetAccessor>(serveGrid(adaptiveGrid));
    TileMosaicProvider fetchingProvider(
        asyncSystem,
        pAccessor,
        createTmsOptions());
    GeoRaster raster = fetchingProvider.getImage(polygon).wait();
    CHECK(raster.getWidth() == adaptiveGrid.getColumns() * TILE_SIZE);
    CHECK(raster.getHeight() == adaptiveGrid.getRows() * TILE_SIZE);
    CHECK(raster.getBounds().contains(computeBounds(polygon)));
  }

  SUBCASE("produces square images on request") {
    const GeoJsonFeature wide =
        polygonBetweenTiles(TileCoord(100, 200, 9), TileCoord(102, 200, 9));
    const TileGrid squareGrid =
        gridProvider.getTileGrid(wide, {}, {}, 9, true);
    CHECK(squareGrid.getColumns() == 3);
    CHECK(squareGrid.getRows() == 3);

    auto pAccessor =
        std::make_shared<SimpleAssetAccessor>(serveGrid(squareGrid));
    TileMosaicProvider provider(asyncSystem, pAccessor, createTmsOptions());
    GeoRaster raster = provider.getImage(wide, {}, {}, 9, true).wait();
    CHECK(raster.getWidth() == raster.getHeight());
  }

  SUBCASE("rejects an oversized grid before requesting anything") {
    TileMosaicOptions options;
    options.zoom.maximumTileCount = 3;
    TileMosaicProvider provider(
        asyncSystem,
        pEmptyAccessor,
        createTmsOptions(),
        options);

    std::optional<CodedError> error =
        waitForError(provider.getImage(polygon, {}, {}, 9));
    REQUIRE(error);
    CHECK(error->code() == ErrorCode::TileBudgetExceeded);
    CHECK(
        std::string(error->what()) ==
        "Requested 4 tiles, which exceeds the maximum allowed (3)");
    CHECK(pEmptyAccessor->requestedUrls.empty());
  }

  SUBCASE("rejects invalid geometry before requesting anything") {
    TileMosaicProvider provider(asyncSystem, pEmptyAccessor, createTmsOptions());

    std::optional<CodedError> missing =
        waitForError(provider.getImage(GeoJsonFeature{}));
    REQUIRE(missing);
    CHECK(missing->code() == ErrorCode::InvalidGeometry);

    GeoJsonFeature point;
    point.geometry = GeoJsonPoint{glm::dvec2(10.0, 20.0)};
    std::optional<CodedError> degenerate =
        waitForError(provider.getImage(point));
    REQUIRE(degenerate);
    CHECK(degenerate->code() == ErrorCode::InvalidGeometry);

    std::optional<CodedError> unreadable =
        waitForError(provider.getImage(std::string_view("{ not json")));
    REQUIRE(unreadable);
    CHECK(unreadable->code() == ErrorCode::InvalidGeometry);

    CHECK(pEmptyAccessor->requestedUrls.empty());
  }

  SUBCASE("fails when any tile fails") {
    std::map<std::string, std::shared_ptr<SimpleAssetRequest>> requests =
        serveGrid(grid);
    const std::string failingUrl = grid.getCell(1, 0).url;
    requests[failingUrl] = createRequest(failingUrl, 404, {});

    auto pAccessor = std::make_shared<SimpleAssetAccessor>(std::move(requests));
    TileMosaicProvider provider(asyncSystem, pAccessor, createTmsOptions());

    std::optional<CodedError> error =
        waitForError(provider.getImage(polygon, {}, {}, 9));
    REQUIRE(error);
    CHECK(error->code() == ErrorCode::TileFetchFailure);
    CHECK(std::string(error->what()).find(failingUrl) != std::string::npos);
    CHECK(
        std::string(error->what()).find("Received response code 404") !=
        std::string::npos);
  }
}

TEST_CASE("TileFetcher::decodeResponse") {
  const std::string url = "https://tiles.example.com/1/2/3.png";

  SUBCASE("decodes a successful response") {
    ImageAsset image =
        TileFetcher::decodeResponse(*createRequest(url, 200, createTilePng(7)));
    CHECK(image.width == TILE_SIZE);
    CHECK(image.channels == 4);
    CHECK(image.pixelData[0] == std::byte(7));
  }

  SUBCASE("accepts the status of file URLs") {
    ImageAsset image =
        TileFetcher::decodeResponse(*createRequest(url, 0, createTilePng(7)));
    CHECK(image.height == TILE_SIZE);
  }

  SUBCASE("rejects failed requests") {
    const auto errorFor = [&url](const SimpleAssetRequest& request) {
      try {
        TileFetcher::decodeResponse(request);
      } catch (const CodedError& e) {
        CHECK(e.code() == ErrorCode::TileFetchFailure);
        CHECK(std::string(e.what()).find(url) != std::string::npos);
        return true;
      }
      return false;
    };

    CHECK(errorFor(*createRequest(url, 500, createTilePng(7))));
    CHECK(errorFor(*createRequest(url, 200, {})));
    CHECK(errorFor(*createRequest(
        url,
        200,
        std::vector<std::byte>(32, std::byte(1)))));
    CHECK(errorFor(SimpleAssetRequest("GET", url, HttpHeaders{}, nullptr)));
  }
}
