#pragma once

#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraImagery/Library.h>

#include <string>
#include <vector>

namespace TesseraImagery {

class GeoRaster;

/**
 * @brief An object found in a raster, as an axis-aligned box in pixel
 * coordinates.
 */
struct TESSERAIMAGERY_API Detection {
  double x1 = 0.0;
  double y1 = 0.0;
  double x2 = 0.0;
  double y2 = 0.0;

  /**
   * @brief The detector's confidence, usually in [0, 1].
   */
  double score = 0.0;

  /**
   * @brief The class of the detected object.
   */
  std::string label;
};

/**
 * @brief Converts detections to polygon features in world coordinates.
 *
 * Each box becomes a closed ring (x1, y1), (x2, y1), (x2, y2), (x1, y2),
 * (x1, y1) mapped through the raster's transform, with `label` and `score`
 * properties.
 */
TESSERAIMAGERY_API std::vector<TesseraGeospatial::GeoJsonFeature>
detectionsToFeatures(
    const GeoRaster& raster,
    const std::vector<Detection>& detections);

} // namespace TesseraImagery
