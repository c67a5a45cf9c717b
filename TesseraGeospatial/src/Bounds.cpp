#include <TesseraGeospatial/Bounds.h>

#include <glm/vec2.hpp>

#include <algorithm>
#include <cmath>

namespace TesseraGeospatial {

glm::dvec2 Bounds::computeCenter() const noexcept {
  return glm::dvec2(
      (this->_west + this->_east) * 0.5,
      (this->_south + this->_north) * 0.5);
}

bool Bounds::contains(const glm::dvec2& lonLat) const noexcept {
  return lonLat.x >= this->_west && lonLat.x <= this->_east &&
         lonLat.y >= this->_south && lonLat.y <= this->_north;
}

bool Bounds::contains(const Bounds& other) const noexcept {
  return other._west >= this->_west && other._east <= this->_east &&
         other._south >= this->_south && other._north <= this->_north;
}

Bounds Bounds::computeUnion(const Bounds& other) const noexcept {
  return Bounds(
      std::min(this->_west, other._west),
      std::min(this->_south, other._south),
      std::max(this->_east, other._east),
      std::max(this->_north, other._north));
}

bool Bounds::equalsEpsilon(const Bounds& other, double epsilon) const noexcept {
  return std::abs(this->_west - other._west) <= epsilon &&
         std::abs(this->_south - other._south) <= epsilon &&
         std::abs(this->_east - other._east) <= epsilon &&
         std::abs(this->_north - other._north) <= epsilon;
}

} // namespace TesseraGeospatial
