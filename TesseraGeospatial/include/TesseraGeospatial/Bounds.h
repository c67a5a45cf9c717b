#pragma once

#include <TesseraGeospatial/Library.h>

#include <glm/vec2.hpp>

namespace TesseraGeospatial {

/**
 * @brief A longitude/latitude rectangle in degrees.
 *
 * Bounds never cross the antimeridian: a valid instance has `east > west` and
 * `north > south`.
 */
class TESSERAGEOSPATIAL_API Bounds final {
public:
  /**
   * @brief Constructs a new instance.
   *
   * @param west The westernmost longitude, in degrees.
   * @param south The southernmost latitude, in degrees.
   * @param east The easternmost longitude, in degrees.
   * @param north The northernmost latitude, in degrees.
   */
  constexpr Bounds(
      double west,
      double south,
      double east,
      double north) noexcept
      : _west(west), _south(south), _east(east), _north(north) {}

  /** @brief Gets the westernmost longitude, in degrees. */
  constexpr double getWest() const noexcept { return this->_west; }

  /** @brief Gets the southernmost latitude, in degrees. */
  constexpr double getSouth() const noexcept { return this->_south; }

  /** @brief Gets the easternmost longitude, in degrees. */
  constexpr double getEast() const noexcept { return this->_east; }

  /** @brief Gets the northernmost latitude, in degrees. */
  constexpr double getNorth() const noexcept { return this->_north; }

  /** @brief Gets the northwest corner as (longitude, latitude). */
  constexpr glm::dvec2 getNorthwest() const noexcept {
    return glm::dvec2(this->_west, this->_north);
  }

  /** @brief Gets the southeast corner as (longitude, latitude). */
  constexpr glm::dvec2 getSoutheast() const noexcept {
    return glm::dvec2(this->_east, this->_south);
  }

  /** @brief Computes the east-west extent in degrees. */
  constexpr double computeWidth() const noexcept {
    return this->_east - this->_west;
  }

  /** @brief Computes the north-south extent in degrees. */
  constexpr double computeHeight() const noexcept {
    return this->_north - this->_south;
  }

  /**
   * @brief Returns `true` if `north > south` and `east > west`.
   */
  constexpr bool isValid() const noexcept {
    return this->_north > this->_south && this->_east > this->_west;
  }

  /**
   * @brief Computes the center as (longitude, latitude).
   */
  glm::dvec2 computeCenter() const noexcept;

  /**
   * @brief Determines if a position lies inside these bounds, edges included.
   *
   * @param lonLat The position as (longitude, latitude) in degrees.
   */
  bool contains(const glm::dvec2& lonLat) const noexcept;

  /**
   * @brief Determines if another instance lies entirely inside this one.
   */
  bool contains(const Bounds& other) const noexcept;

  /**
   * @brief Computes the smallest bounds containing both this instance and
   * another one.
   */
  Bounds computeUnion(const Bounds& other) const noexcept;

  /**
   * @brief Returns `true` if every edge is within `epsilon` degrees of the
   * corresponding edge of `other`.
   */
  bool equalsEpsilon(const Bounds& other, double epsilon) const noexcept;

  constexpr bool operator==(const Bounds& other) const noexcept {
    return this->_west == other._west && this->_south == other._south &&
           this->_east == other._east && this->_north == other._north;
  }

private:
  double _west;
  double _south;
  double _east;
  double _north;
};

} // namespace TesseraGeospatial
