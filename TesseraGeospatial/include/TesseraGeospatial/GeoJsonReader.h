#pragma once

#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraGeospatial/Library.h>
#include <TesseraUtility/Result.h>

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace TesseraGeospatial {

/**
 * @brief Reads GeoJSON features.
 *
 * Supports `Point`, `LineString`, `Polygon` and `MultiPolygon` geometries.
 * Heights in three-component positions are ignored. Property values that are
 * objects or arrays are dropped with a warning.
 */
class TESSERAGEOSPATIAL_API GeoJsonReader final {
public:
  /**
   * @brief Reads a single feature.
   *
   * Accepts a `Feature`, a bare geometry object (wrapped in a feature with no
   * properties), or a `FeatureCollection` holding exactly one feature.
   */
  static TesseraUtility::Result<GeoJsonFeature>
  readFeature(const std::span<const std::byte>& data);

  /** @copydoc readFeature(const std::span<const std::byte>&) */
  static TesseraUtility::Result<GeoJsonFeature>
  readFeature(std::string_view json);

  /**
   * @brief Reads every feature of a `FeatureCollection`. A single `Feature` is
   * returned as a collection of one.
   */
  static TesseraUtility::Result<std::vector<GeoJsonFeature>>
  readFeatureCollection(const std::span<const std::byte>& data);
};

} // namespace TesseraGeospatial
