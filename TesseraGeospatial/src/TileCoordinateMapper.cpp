#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/TileCoordinateMapper.h>
#include <TesseraUtility/Math.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

using namespace TesseraGeometry;
using namespace TesseraUtility;

namespace TesseraGeospatial {

namespace {
int32_t clampIndex(double value, int64_t n) {
  const double clamped =
      std::clamp(std::floor(value), 0.0, static_cast<double>(n - 1));
  return static_cast<int32_t>(clamped);
}

double tileXToLongitude(int64_t x, int64_t n) {
  return static_cast<double>(x) / static_cast<double>(n) * 360.0 - 180.0;
}

double tileYToLatitude(int64_t y, int64_t n) {
  const double mercatorY =
      Math::OnePi *
      (1.0 - 2.0 * static_cast<double>(y) / static_cast<double>(n));
  return Math::radiansToDegrees(std::atan(std::sinh(mercatorY)));
}
} // namespace

/*static*/ TileCoord TileCoordinateMapper::lonLatToTile(
    double longitude,
    double latitude,
    int32_t zoom) noexcept {
  const int64_t n = TileCoord::tilesAtZoom(zoom);
  const double latitudeRadians = Math::degreesToRadians(
      std::clamp(latitude, -MAXIMUM_LATITUDE, MAXIMUM_LATITUDE));

  const double x = (longitude + 180.0) / 360.0 * static_cast<double>(n);
  const double y =
      (1.0 -
       std::log(std::tan(latitudeRadians) + 1.0 / std::cos(latitudeRadians)) /
           Math::OnePi) /
      2.0 * static_cast<double>(n);

  return TileCoord(clampIndex(x, n), clampIndex(y, n), zoom);
}

/*static*/ Bounds
TileCoordinateMapper::tileToBounds(const TileCoord& coord) noexcept {
  const int64_t n = TileCoord::tilesAtZoom(coord.z);
  return Bounds(
      tileXToLongitude(coord.x, n),
      tileYToLatitude(int64_t(coord.y) + 1, n),
      tileXToLongitude(int64_t(coord.x) + 1, n),
      tileYToLatitude(coord.y, n));
}

/*static*/ TileRange TileCoordinateMapper::computeTileRange(
    const Bounds& bounds,
    int32_t zoom) noexcept {
  const TileCoord topLeft =
      lonLatToTile(bounds.getWest(), bounds.getNorth(), zoom);
  const TileCoord bottomRight =
      lonLatToTile(bounds.getEast(), bounds.getSouth(), zoom);
  return TileRange::fromCorners(topLeft, bottomRight);
}

} // namespace TesseraGeospatial
