#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraUtility/CodedError.h>

#include <fmt/format.h>
#include <glm/vec2.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <variant>
#include <vector>

using namespace TesseraUtility;

namespace TesseraGeospatial {

namespace {
struct PositionCollector {
  std::vector<glm::dvec2>& positions;

  void operator()(const GeoJsonPoint& point) {
    positions.emplace_back(point.coordinates);
  }

  void operator()(const GeoJsonLineString& line) {
    positions.insert(
        positions.end(),
        line.coordinates.begin(),
        line.coordinates.end());
  }

  void operator()(const GeoJsonPolygon& polygon) {
    for (const std::vector<glm::dvec2>& ring : polygon.coordinates) {
      positions.insert(positions.end(), ring.begin(), ring.end());
    }
  }

  void operator()(const GeoJsonMultiPolygon& multiPolygon) {
    for (const auto& polygon : multiPolygon.coordinates) {
      for (const std::vector<glm::dvec2>& ring : polygon) {
        positions.insert(positions.end(), ring.begin(), ring.end());
      }
    }
  }
};
} // namespace

GeoJsonPolygon polygonFromBounds(const Bounds& bounds) {
  return GeoJsonPolygon{
      {{glm::dvec2(bounds.getWest(), bounds.getNorth()),
        glm::dvec2(bounds.getWest(), bounds.getSouth()),
        glm::dvec2(bounds.getEast(), bounds.getSouth()),
        glm::dvec2(bounds.getEast(), bounds.getNorth()),
        glm::dvec2(bounds.getWest(), bounds.getNorth())}}};
}

std::vector<glm::dvec2> collectPositions(const GeoJsonGeometry& geometry) {
  std::vector<glm::dvec2> positions;
  std::visit(PositionCollector{positions}, geometry);
  return positions;
}

Bounds computeBounds(const GeoJsonFeature& feature) {
  if (!feature.geometry) {
    throw CodedError(
        ErrorCode::InvalidGeometry,
        "The feature has no geometry.");
  }

  const std::vector<glm::dvec2> positions = collectPositions(*feature.geometry);
  if (positions.empty()) {
    throw CodedError(
        ErrorCode::InvalidGeometry,
        "The feature's geometry has no coordinates.");
  }

  double west = std::numeric_limits<double>::max();
  double south = std::numeric_limits<double>::max();
  double east = std::numeric_limits<double>::lowest();
  double north = std::numeric_limits<double>::lowest();

  for (const glm::dvec2& position : positions) {
    if (!std::isfinite(position.x) || !std::isfinite(position.y)) {
      throw CodedError(
          ErrorCode::InvalidGeometry,
          "The feature's geometry contains a non-finite coordinate.");
    }
    west = std::min(west, position.x);
    east = std::max(east, position.x);
    south = std::min(south, position.y);
    north = std::max(north, position.y);
  }

  Bounds bounds(west, south, east, north);
  if (!bounds.isValid()) {
    throw CodedError(
        ErrorCode::InvalidGeometry,
        fmt::format(
            "The feature's geometry has a degenerate extent (west {}, south "
            "{}, east {}, north {}).",
            west,
            south,
            east,
            north));
  }

  return bounds;
}

GeoJsonFeature withProperties(
    const GeoJsonFeature& feature,
    const std::function<void(GeoJsonProperties&)>& mutate) {
  GeoJsonFeature copy = feature;
  mutate(copy.properties);
  return copy;
}

} // namespace TesseraGeospatial
