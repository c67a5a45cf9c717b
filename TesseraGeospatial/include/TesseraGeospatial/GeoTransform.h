#pragma once

#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/Library.h>

#include <glm/vec2.hpp>

#include <array>
#include <cstdint>

namespace TesseraGeospatial {

/**
 * @brief An affine transform from pixel coordinates to world coordinates.
 *
 * A pixel position (x, y), with y increasing downward, maps to
 * (a·x + b·y + c, d·x + e·y + f). For north-up rasters produced by
 * {@link fromBounds}, `b` and `d` are zero and `e` is negative.
 */
class TESSERAGEOSPATIAL_API GeoTransform final {
public:
  /**
   * @brief Constructs a transform from its six coefficients.
   */
  constexpr GeoTransform(
      double a,
      double b,
      double c,
      double d,
      double e,
      double f) noexcept
      : _a(a), _b(b), _c(c), _d(d), _e(e), _f(f) {}

  /**
   * @brief Creates the transform of a north-up raster that exactly covers
   * `bounds` with `width` × `height` pixels.
   *
   * The top-left corner of pixel (0, 0) maps to (west, north) and the
   * bottom-right corner of the last pixel maps to (east, south).
   */
  static GeoTransform
  fromBounds(const Bounds& bounds, int32_t width, int32_t height) noexcept;

  /** @brief Gets the x scale. */
  constexpr double getA() const noexcept { return this->_a; }
  /** @brief Gets the y skew. */
  constexpr double getB() const noexcept { return this->_b; }
  /** @brief Gets the x offset. */
  constexpr double getC() const noexcept { return this->_c; }
  /** @brief Gets the x skew. */
  constexpr double getD() const noexcept { return this->_d; }
  /** @brief Gets the y scale. */
  constexpr double getE() const noexcept { return this->_e; }
  /** @brief Gets the y offset. */
  constexpr double getF() const noexcept { return this->_f; }

  /**
   * @brief Gets the coefficients in the order a, b, c, d, e, f.
   */
  constexpr std::array<double, 6> toArray() const noexcept {
    return {this->_a, this->_b, this->_c, this->_d, this->_e, this->_f};
  }

  /**
   * @brief Computes `a·e - b·d`. The transform is invertible when this is
   * non-zero.
   */
  constexpr double computeDeterminant() const noexcept {
    return this->_a * this->_e - this->_b * this->_d;
  }

  /**
   * @brief Maps a pixel position to (longitude, latitude).
   */
  glm::dvec2 pixelToWorld(double x, double y) const noexcept;

  /**
   * @brief Maps a world position to the nearest pixel position.
   *
   * @param longitude The longitude in degrees.
   * @param latitude The latitude in degrees.
   * @return The pixel position, rounded to the nearest integer. Positions
   * outside the raster produce indices outside its dimensions.
   * @throws TesseraUtility::CodedError with
   * `ErrorCode::DegenerateTransform` if the determinant is zero.
   */
  glm::ivec2 worldToPixel(double longitude, double latitude) const;

  constexpr bool operator==(const GeoTransform& other) const noexcept {
    return this->toArray() == other.toArray();
  }

private:
  double _a;
  double _b;
  double _c;
  double _d;
  double _e;
  double _f;
};

} // namespace TesseraGeospatial
