#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoTransform.h>
#include <TesseraUtility/CodedError.h>
#include <TesseraUtility/Math.h>

#include <doctest/doctest.h>
#include <glm/vec2.hpp>

#include <array>
#include <cmath>

using namespace TesseraGeospatial;
using namespace TesseraUtility;

TEST_CASE("GeoTransform") {
  const Bounds bounds(-10.0, 40.0, 10.0, 50.0);
  const GeoTransform transform = GeoTransform::fromBounds(bounds, 200, 100);

  SUBCASE("fromBounds derives a north-up transform") {
    CHECK(transform.getA() == doctest::Approx(0.1));
    CHECK(transform.getB() == 0.0);
    CHECK(transform.getC() == -10.0);
    CHECK(transform.getD() == 0.0);
    CHECK(transform.getE() == doctest::Approx(-0.1));
    CHECK(transform.getF() == 50.0);
    CHECK(transform.computeDeterminant() == doctest::Approx(-0.01));
  }

  SUBCASE("the raster corners map to the bounds corners") {
    glm::dvec2 topLeft = transform.pixelToWorld(0.0, 0.0);
    glm::dvec2 bottomRight = transform.pixelToWorld(200.0, 100.0);
    CHECK(Math::equalsEpsilon(topLeft, glm::dvec2(-10.0, 50.0), Math::Epsilon9));
    CHECK(Math::equalsEpsilon(
        bottomRight,
        glm::dvec2(10.0, 40.0),
        Math::Epsilon9));
  }

  SUBCASE("worldToPixel inverts pixelToWorld") {
    for (int x = 0; x < 200; x += 17) {
      for (int y = 0; y < 100; y += 13) {
        glm::dvec2 world = transform.pixelToWorld(x, y);
        glm::ivec2 pixel = transform.worldToPixel(world.x, world.y);
        CHECK(pixel == glm::ivec2(x, y));
      }
    }
  }

  SUBCASE("worldToPixel rounds to the nearest pixel") {
    CHECK(transform.worldToPixel(-9.96, 49.96) == glm::ivec2(0, 0));
    CHECK(transform.worldToPixel(-9.94, 49.94) == glm::ivec2(1, 1));
  }

  SUBCASE("round trip stays within half a pixel inside the bounds") {
    for (double lon = -9.99; lon < 10.0; lon += 1.37) {
      for (double lat = 40.01; lat < 50.0; lat += 0.93) {
        glm::ivec2 pixel = transform.worldToPixel(lon, lat);
        glm::dvec2 back = transform.pixelToWorld(pixel.x, pixel.y);
        CHECK(std::abs(back.x - lon) <= 0.5 * 0.1 + Math::Epsilon9);
        CHECK(std::abs(back.y - lat) <= 0.5 * 0.1 + Math::Epsilon9);
      }
    }
  }

  SUBCASE("a degenerate transform cannot be inverted") {
    GeoTransform degenerate(0.0, 0.0, 5.0, 0.0, -1.0, 10.0);
    bool thrown = false;
    try {
      (void)degenerate.worldToPixel(5.0, 5.0);
    } catch (const CodedError& e) {
      thrown = true;
      CHECK(e.code() == ErrorCode::DegenerateTransform);
    }
    CHECK(thrown);
  }

  SUBCASE("toArray lists the coefficients in order") {
    GeoTransform t(1.0, 2.0, 3.0, 4.0, 5.0, 6.0);
    CHECK(t.toArray() == std::array<double, 6>{1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
  }
}
