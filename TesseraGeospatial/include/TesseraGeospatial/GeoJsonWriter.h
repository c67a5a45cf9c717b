#pragma once

#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraGeospatial/Library.h>

#include <string>
#include <vector>

namespace TesseraGeospatial {

/**
 * @brief Serializes features to compact GeoJSON text.
 */
class TESSERAGEOSPATIAL_API GeoJsonWriter final {
public:
  /**
   * @brief Writes a single `Feature` object.
   */
  static std::string writeFeature(const GeoJsonFeature& feature);

  /**
   * @brief Writes a `FeatureCollection` holding the given features in order.
   */
  static std::string
  writeFeatureCollection(const std::vector<GeoJsonFeature>& features);
};

} // namespace TesseraGeospatial
