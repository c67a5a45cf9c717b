#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraGeospatial/GeoJsonReader.h>
#include <TesseraGeospatial/GeoJsonWriter.h>
#include <TesseraImagery/Detections.h>
#include <TesseraImagery/GeoRaster.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraUtility/Result.h>

#include <doctest/doctest.h>
#include <glm/vec2.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <variant>
#include <vector>

using namespace TesseraGeospatial;
using namespace TesseraImagery;
using namespace TesseraUtility;

TEST_CASE("detectionsToFeatures") {
  GeoRaster raster(ImageAsset(100, 50, 3), Bounds(10.0, 40.0, 11.0, 40.5));

  std::vector<Detection> detections{
      Detection{10.0, 5.0, 30.0, 25.0, 0.9, "ship"},
      Detection{0.0, 0.0, 100.0, 50.0, 0.25, "harbor"}};

  std::vector<GeoJsonFeature> features =
      detectionsToFeatures(raster, detections);
  REQUIRE(features.size() == 2);

  SUBCASE("outlines each box as a closed ring in world coordinates") {
    REQUIRE(features[0].geometry);
    const GeoJsonPolygon& polygon =
        std::get<GeoJsonPolygon>(*features[0].geometry);
    REQUIRE(polygon.coordinates.size() == 1);
    const std::vector<glm::dvec2>& ring = polygon.coordinates[0];
    REQUIRE(ring.size() == 5);
    CHECK(ring.front() == ring.back());
    CHECK(ring[0] == raster.pixelToWorld(10.0, 5.0));
    CHECK(ring[1] == raster.pixelToWorld(30.0, 5.0));
    CHECK(ring[2] == raster.pixelToWorld(30.0, 25.0));
    CHECK(ring[3] == raster.pixelToWorld(10.0, 25.0));

    const Bounds whole = computeBounds(features[1]);
    CHECK(whole.equalsEpsilon(raster.getBounds(), 1e-12));
  }

  SUBCASE("carries the label and score") {
    CHECK(std::get<std::string>(features[0].properties.at("label")) == "ship");
    CHECK(std::get<double>(features[0].properties.at("score")) == 0.9);
    CHECK(
        std::get<std::string>(features[1].properties.at("label")) == "harbor");
  }

  SUBCASE("serializes to a FeatureCollection") {
    const std::string json = GeoJsonWriter::writeFeatureCollection(features);
    Result<std::vector<GeoJsonFeature>> result =
        GeoJsonReader::readFeatureCollection(std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(json.data()),
            json.size()));
    REQUIRE(result.value);
    REQUIRE(result.value->size() == 2);
    CHECK(
        std::get<std::string>((*result.value)[1].properties.at("label")) ==
        "harbor");
  }

  SUBCASE("returns nothing for no detections") {
    CHECK(detectionsToFeatures(raster, {}).empty());
  }
}
