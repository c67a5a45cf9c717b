#pragma once

#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/Library.h>

#include <glm/vec2.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace TesseraGeospatial {

/**
 * @brief A GeoJSON `Point` geometry. Positions are (longitude, latitude) in
 * degrees.
 */
struct GeoJsonPoint {
  /** @brief The position. */
  glm::dvec2 coordinates{0.0, 0.0};
};

/**
 * @brief A GeoJSON `LineString` geometry.
 */
struct GeoJsonLineString {
  /** @brief The positions along the line. */
  std::vector<glm::dvec2> coordinates;
};

/**
 * @brief A GeoJSON `Polygon` geometry: an outer ring followed by any holes.
 * Each ring is closed, its first and last positions being equal.
 */
struct GeoJsonPolygon {
  /** @brief The linear rings. */
  std::vector<std::vector<glm::dvec2>> coordinates;
};

/**
 * @brief A GeoJSON `MultiPolygon` geometry.
 */
struct GeoJsonMultiPolygon {
  /** @brief The rings of each polygon. */
  std::vector<std::vector<std::vector<glm::dvec2>>> coordinates;
};

/**
 * @brief Any of the supported GeoJSON geometries.
 */
using GeoJsonGeometry = std::variant<
    GeoJsonPoint,
    GeoJsonLineString,
    GeoJsonPolygon,
    GeoJsonMultiPolygon>;

/**
 * @brief A property value: null, boolean, number or string.
 */
using GeoJsonPropertyValue =
    std::variant<std::monostate, bool, double, std::string>;

/**
 * @brief The `properties` member of a feature.
 */
using GeoJsonProperties = std::map<std::string, GeoJsonPropertyValue>;

/**
 * @brief A GeoJSON `Feature`.
 */
struct TESSERAGEOSPATIAL_API GeoJsonFeature {
  /** @brief The feature's `id`, if it has one. */
  std::optional<std::string> id;

  /** @brief The geometry, or `std::nullopt` for a null geometry. */
  std::optional<GeoJsonGeometry> geometry;

  /** @brief The feature's properties. */
  GeoJsonProperties properties;
};

/**
 * @brief Creates a closed, counter-clockwise polygon ring tracing a
 * rectangle, starting at its northwest corner.
 */
TESSERAGEOSPATIAL_API GeoJsonPolygon polygonFromBounds(const Bounds& bounds);

/**
 * @brief Gets every position of a geometry, in document order.
 */
TESSERAGEOSPATIAL_API std::vector<glm::dvec2>
collectPositions(const GeoJsonGeometry& geometry);

/**
 * @brief Computes the bounding box of a feature's geometry.
 *
 * @throws TesseraUtility::CodedError with `ErrorCode::InvalidGeometry` if the
 * feature has no geometry, no positions, a non-finite position, or its
 * positions span zero width or zero height.
 */
TESSERAGEOSPATIAL_API Bounds computeBounds(const GeoJsonFeature& feature);

/**
 * @brief Returns a copy of `feature` whose properties have been changed by
 * `mutate`. The input feature is not modified.
 */
TESSERAGEOSPATIAL_API GeoJsonFeature withProperties(
    const GeoJsonFeature& feature,
    const std::function<void(GeoJsonProperties&)>& mutate);

} // namespace TesseraGeospatial
