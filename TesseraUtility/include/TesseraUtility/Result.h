#pragma once

#include <TesseraUtility/ErrorList.h>

#include <optional>
#include <utility>

namespace TesseraUtility {

/**
 * @brief Holds the result of an operation that can produce a value together
 * with errors and warnings.
 *
 * A Result with errors may or may not also hold a value; callers should check
 * `value` before using it and log or merge `errors` either way.
 *
 * @tparam T The type of value contained in the result.
 */
template <typename T> struct Result {
  /**
   * @brief Creates a `Result` with the given value and an empty
   * {@link ErrorList}.
   */
  Result(T value_) noexcept : value(std::move(value_)), errors() {}

  /**
   * @brief Creates a `Result` with the given value and errors.
   */
  Result(T value_, ErrorList errors_) noexcept
      : value(std::move(value_)), errors(std::move(errors_)) {}

  /**
   * @brief Creates a `Result` with no value and the given errors.
   */
  Result(ErrorList errors_) noexcept : value(), errors(std::move(errors_)) {}

  /**
   * @brief The value, if the operation succeeded to the point where it can
   * provide one.
   */
  std::optional<T> value;

  /**
   * @brief The errors and warnings that occurred during the operation.
   */
  ErrorList errors;
};

} // namespace TesseraUtility
