#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeospatial/TileCoordinateMapper.h>
#include <TesseraImagery/TileUrlStrategy.h>
#include <TesseraUtility/CodedError.h>

#include <doctest/doctest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

using namespace TesseraGeometry;
using namespace TesseraGeospatial;
using namespace TesseraImagery;
using namespace TesseraUtility;

namespace {
std::optional<ErrorCode> createErrorCode(const ProviderOptions& options) {
  try {
    TileUrlStrategy::create(options);
  } catch (const CodedError& e) {
    return e.code();
  }
  return std::nullopt;
}
} // namespace

TEST_CASE("TileUrlStrategy for Mapbox") {
  TileUrlStrategy strategy =
      TileUrlStrategy::create(MapboxOptions{"pk.test-token"});

  CHECK(
      strategy.getTileUrl(TileCoord(655, 1583, 12)) ==
      "https://api.mapbox.com/v4/mapbox.satellite/12/655/1583.png"
      "?access_token=pk.test-token");
  CHECK(strategy.getAttribution() == "© Mapbox");
  CHECK(strategy.getRequestHeaders().empty());
  CHECK(strategy.getProviderName() == "mapbox");
  CHECK(strategy.getTileSize() == 256);

  SUBCASE("ignores bands and expressions") {
    TileUrlContext context{{1, 2, 3}, "b1*2"};
    CHECK(
        strategy.getTileUrl(TileCoord(1, 2, 3), context) ==
        "https://api.mapbox.com/v4/mapbox.satellite/3/1/2.png"
        "?access_token=pk.test-token");
  }

  SUBCASE("requires an API key") {
    CHECK(createErrorCode(MapboxOptions{}) == ErrorCode::InvalidArgument);
  }
}

TEST_CASE("TileUrlStrategy for Geobase") {
  GeobaseOptions options;
  options.projectRef = "wmrosdnjsecywfkvxtrw";
  options.cogImagery =
      "https://oin-hotosm-temp.s3.us-east-1.amazonaws.com/"
      "63556b6771072f000580f8cd/0/63556b6771072f000580f8ce.tif";
  options.apikey = "test-key";
  TileUrlStrategy strategy = TileUrlStrategy::create(options);

  const std::string base =
      "https://wmrosdnjsecywfkvxtrw.geobase.app/titiler/v1/cog/tiles/"
      "WebMercatorQuad/18/123/456?url=" +
      options.cogImagery + "&apikey=test-key";

  CHECK(strategy.getTileUrl(TileCoord(123, 456, 18)) == base);
  CHECK(strategy.getAttribution() == "Geobase");
  CHECK(strategy.getProviderName() == "geobase");

  SUBCASE("appends one bidx parameter per band") {
    CHECK(
        strategy.getTileUrl(TileCoord(123, 456, 18), TileUrlContext{{1, 3}}) ==
        base + "&bidx=1&bidx=3");
  }

  SUBCASE("percent-encodes the expression") {
    TileUrlContext context{{}, "(b1-b2)/(b1+b2)"};
    CHECK(
        strategy.getTileUrl(TileCoord(123, 456, 18), context) ==
        base + "&expression=%28b1-b2%29%2F%28b1%2Bb2%29");
  }

  SUBCASE("requires every connection parameter") {
    GeobaseOptions missingRef = options;
    missingRef.projectRef.clear();
    CHECK(createErrorCode(missingRef) == ErrorCode::InvalidArgument);

    GeobaseOptions missingCog = options;
    missingCog.cogImagery.clear();
    CHECK(createErrorCode(missingCog) == ErrorCode::InvalidArgument);

    GeobaseOptions missingKey = options;
    missingKey.apikey.clear();
    CHECK(createErrorCode(missingKey) == ErrorCode::InvalidArgument);
  }
}

TEST_CASE("TileUrlStrategy for ESRI") {
  SUBCASE("defaults to World Imagery") {
    TileUrlStrategy strategy = TileUrlStrategy::create(EsriOptions{});
    CHECK(
        strategy.getTileUrl(TileCoord(655, 1583, 12)) ==
        "https://server.arcgisonline.com/ArcGIS/rest/services/World_Imagery/"
        "MapServer/tile/12/1583/655");
    CHECK(strategy.getAttribution() == "Esri World Imagery");
    CHECK(strategy.getProviderName() == "esri");
    CHECK(strategy.getTileSize() == 256);
  }

  SUBCASE("uses a custom service and removes a trailing slash") {
    EsriOptions options;
    options.serviceUrl = "https://example.com/arcgis/rest/services/";
    options.serviceName = "Custom";
    options.tileSize = 512;
    TileUrlStrategy strategy = TileUrlStrategy::create(options);
    CHECK(
        strategy.getTileUrl(TileCoord(1, 2, 3)) ==
        "https://example.com/arcgis/rest/services/Custom/MapServer/tile/3/2/1");
    CHECK(strategy.getTileSize() == 512);
    CHECK(
        std::get<EsriOptions>(strategy.getOptions()).serviceUrl ==
        "https://example.com/arcgis/rest/services");
  }

  SUBCASE("rejects invalid options") {
    EsriOptions noUrl;
    noUrl.serviceUrl = "";
    CHECK(createErrorCode(noUrl) == ErrorCode::InvalidArgument);

    EsriOptions relative;
    relative.serviceUrl = "not a url";
    CHECK(createErrorCode(relative) == ErrorCode::InvalidArgument);

    EsriOptions badSize;
    badSize.tileSize = 0;
    CHECK(createErrorCode(badSize) == ErrorCode::InvalidArgument);
  }
}

TEST_CASE("TileUrlStrategy for TMS") {
  SUBCASE("counts rows from the bottom and appends the key") {
    TmsOptions options;
    options.baseUrl = "https://tile.sentinelmap.eu/2016/summer/rgb";
    options.apiKey = "875e6b1c0ef7a112d1267ec91353809d";
    TileUrlStrategy strategy = TileUrlStrategy::create(options);
    CHECK(
        strategy.getTileUrl(TileCoord(8800, 5371, 14)) ==
        "https://tile.sentinelmap.eu/2016/summer/rgb/14/8800/11012.jpg"
        "?key=875e6b1c0ef7a112d1267ec91353809d");
    CHECK(strategy.getAttribution() == "TMS");
    CHECK(strategy.getProviderName() == "tms");
  }

  SUBCASE("uses the extension and no key") {
    TmsOptions options;
    options.baseUrl = "https://example.com/tiles/";
    options.extension = "png";
    TileUrlStrategy strategy = TileUrlStrategy::create(options);
    CHECK(
        strategy.getTileUrl(TileCoord(5, 5, 3)) ==
        "https://example.com/tiles/3/5/2.png");
  }

  SUBCASE("treats an empty key as no key") {
    TmsOptions options;
    options.baseUrl = "https://example.com/tiles";
    options.apiKey = "";
    TileUrlStrategy strategy = TileUrlStrategy::create(options);
    CHECK(
        strategy.getTileUrl(TileCoord(0, 0, 0)) ==
        "https://example.com/tiles/0/0/0.jpg");
  }

  SUBCASE("exposes custom headers") {
    TmsOptions options;
    options.baseUrl = "https://example.com/tiles";
    options.headers = {{"Referer", "https://example.com"}};
    options.attribution = "Example";
    TileUrlStrategy strategy = TileUrlStrategy::create(options);
    REQUIRE(strategy.getRequestHeaders().size() == 1);
    CHECK(strategy.getRequestHeaders()[0].first == "Referer");
    CHECK(strategy.getAttribution() == "Example");
  }

  SUBCASE("requires a base URL") {
    CHECK(createErrorCode(TmsOptions{}) == ErrorCode::InvalidArgument);
  }
}

TEST_CASE("TileUrlStrategy row origin") {
  const TileCoord coord(3, 1, 2);
  const int32_t flipped = TileCoordinateMapper::flipRowOrigin(coord.y, coord.z);
  CHECK(flipped == 2);

  TmsOptions tms;
  tms.baseUrl = "https://example.com";
  CHECK(
      TileUrlStrategy::create(tms).getTileUrl(coord) ==
      "https://example.com/2/3/2.jpg");

  // Every other provider uses the top-left origin unchanged.
  CHECK(
      TileUrlStrategy::create(EsriOptions{}).getTileUrl(coord) ==
      "https://server.arcgisonline.com/ArcGIS/rest/services/World_Imagery/"
      "MapServer/tile/2/1/3");
  CHECK(
      TileUrlStrategy::create(MapboxOptions{"k"}).getTileUrl(coord) ==
      "https://api.mapbox.com/v4/mapbox.satellite/2/3/1.png?access_token=k");

  GeobaseOptions geobase{"ref", "https://example.com/a.tif", "k"};
  CHECK(
      TileUrlStrategy::create(geobase).getTileUrl(coord) ==
      "https://ref.geobase.app/titiler/v1/cog/tiles/WebMercatorQuad/2/3/1"
      "?url=https://example.com/a.tif&apikey=k");
}
