#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoTransform.h>
#include <TesseraUtility/CodedError.h>

#include <fmt/format.h>
#include <glm/vec2.hpp>

#include <cmath>
#include <cstdint>

using namespace TesseraUtility;

namespace TesseraGeospatial {

/*static*/ GeoTransform GeoTransform::fromBounds(
    const Bounds& bounds,
    int32_t width,
    int32_t height) noexcept {
  return GeoTransform(
      bounds.computeWidth() / static_cast<double>(width),
      0.0,
      bounds.getWest(),
      0.0,
      -bounds.computeHeight() / static_cast<double>(height),
      bounds.getNorth());
}

glm::dvec2 GeoTransform::pixelToWorld(double x, double y) const noexcept {
  return glm::dvec2(
      this->_a * x + this->_b * y + this->_c,
      this->_d * x + this->_e * y + this->_f);
}

glm::ivec2 GeoTransform::worldToPixel(double longitude, double latitude) const {
  const double det = this->computeDeterminant();
  if (det == 0.0 || !std::isfinite(det)) {
    throw CodedError(
        ErrorCode::DegenerateTransform,
        fmt::format(
            "Cannot invert the transform [{}, {}, {}, {}, {}, {}] because its "
            "determinant is zero.",
            this->_a,
            this->_b,
            this->_c,
            this->_d,
            this->_e,
            this->_f));
  }

  const double dx = longitude - this->_c;
  const double dy = latitude - this->_f;
  const double x = (this->_e * dx - this->_b * dy) / det;
  const double y = (-this->_d * dx + this->_a * dy) / det;

  return glm::ivec2(
      static_cast<int32_t>(std::lround(x)),
      static_cast<int32_t>(std::lround(y)));
}

} // namespace TesseraGeospatial
