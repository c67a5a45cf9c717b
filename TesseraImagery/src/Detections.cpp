#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraImagery/Detections.h>
#include <TesseraImagery/GeoRaster.h>

#include <glm/vec2.hpp>

#include <utility>
#include <vector>

using namespace TesseraGeospatial;

namespace TesseraImagery {

std::vector<GeoJsonFeature> detectionsToFeatures(
    const GeoRaster& raster,
    const std::vector<Detection>& detections) {
  std::vector<GeoJsonFeature> result;
  result.reserve(detections.size());

  for (const Detection& detection : detections) {
    std::vector<glm::dvec2> ring{
        raster.pixelToWorld(detection.x1, detection.y1),
        raster.pixelToWorld(detection.x2, detection.y1),
        raster.pixelToWorld(detection.x2, detection.y2),
        raster.pixelToWorld(detection.x1, detection.y2),
        raster.pixelToWorld(detection.x1, detection.y1)};

    GeoJsonFeature& feature = result.emplace_back();
    feature.geometry = GeoJsonPolygon{{std::move(ring)}};
    feature.properties["label"] = detection.label;
    feature.properties["score"] = detection.score;
  }

  return result;
}

} // namespace TesseraImagery
