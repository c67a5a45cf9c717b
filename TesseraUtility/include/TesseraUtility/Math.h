#pragma once

#include <TesseraUtility/Library.h>

#include <glm/common.hpp>
#include <glm/ext/vector_double2.hpp>

namespace TesseraUtility {

/**
 * @brief Mathematical constants and functions
 */
class TESSERAUTILITY_API Math final {
public:
  /** @brief 0.001 */
  static constexpr double Epsilon3 = 1e-3;

  /** @brief 0.000001 */
  static constexpr double Epsilon6 = 1e-6;

  /** @brief 0.000000001 */
  static constexpr double Epsilon9 = 1e-9;

  /** @brief 0.000000000001 */
  static constexpr double Epsilon12 = 1e-12;

  /**
   * @brief Pi
   */
  static constexpr double OnePi = 3.14159265358979323846;

  /**
   * @brief Two times pi
   */
  static constexpr double TwoPi = OnePi * 2.0;

  /**
   * @brief Pi divided by two
   */
  static constexpr double PiOverTwo = OnePi / 2.0;

  /**
   * @brief Pi divided by four
   */
  static constexpr double PiOverFour = OnePi / 4.0;

  /**
   * @brief Converts a relative to an absolute epsilon, for the epsilon-equality
   * check between two values.
   */
  static constexpr double relativeEpsilonToAbsolute(
      double a,
      double b,
      double relativeEpsilon) noexcept {
    return relativeEpsilon * glm::max(glm::abs(a), glm::abs(b));
  }

  /**
   * @brief Checks whether two values are equal up to a given relative epsilon.
   */
  static constexpr bool
  equalsEpsilon(double left, double right, double relativeEpsilon) noexcept {
    return equalsEpsilon(left, right, relativeEpsilon, relativeEpsilon);
  }

  /**
   * @brief Determines if two values are equal using an absolute or relative
   * tolerance test.
   *
   * The values are first compared using an absolute tolerance test. If that
   * fails, a relative tolerance test is performed.
   *
   * @param left The first value to compare.
   * @param right The other value to compare.
   * @param relativeEpsilon The maximum inclusive delta between `left` and
   * `right` for the relative tolerance test.
   * @param absoluteEpsilon The maximum inclusive delta between `left` and
   * `right` for the absolute tolerance test.
   */
  static constexpr bool equalsEpsilon(
      double left,
      double right,
      double relativeEpsilon,
      double absoluteEpsilon) noexcept {
    const double diff = glm::abs(left - right);
    return diff <= absoluteEpsilon ||
           diff <= relativeEpsilonToAbsolute(left, right, relativeEpsilon);
  }

  /**
   * @brief Checks whether two 2D positions are equal, component by component,
   * up to an absolute epsilon.
   */
  static bool equalsEpsilon(
      const glm::dvec2& left,
      const glm::dvec2& right,
      double absoluteEpsilon) noexcept {
    return glm::abs(left.x - right.x) <= absoluteEpsilon &&
           glm::abs(left.y - right.y) <= absoluteEpsilon;
  }

  /**
   * @brief Converts degrees to radians.
   */
  static constexpr double degreesToRadians(double angleDegrees) noexcept {
    return angleDegrees * OnePi / 180.0;
  }

  /**
   * @brief Converts radians to degrees.
   */
  static constexpr double radiansToDegrees(double angleRadians) noexcept {
    return angleRadians * 180.0 / OnePi;
  }

  /**
   * @brief Constrains a value to the given range.
   */
  static constexpr double clamp(double value, double min, double max) noexcept {
    return glm::clamp(value, min, max);
  }
};

} // namespace TesseraUtility
