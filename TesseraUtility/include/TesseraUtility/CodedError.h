#pragma once

#include <TesseraUtility/Library.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace TesseraUtility {

/**
 * @brief Identifies the kind of failure reported by a {@link CodedError}.
 *
 * The numeric values are stable and may be reported to users or logged.
 */
enum class ErrorCode : int32_t {
  /**
   * @brief The tile grid for a request is larger than the configured
   * maximum tile count.
   */
  TileBudgetExceeded = 1001,

  /**
   * @brief A required argument is missing or out of range.
   */
  InvalidArgument = 1003,

  /**
   * @brief A geometry has no coordinates or describes a zero-area extent.
   */
  InvalidGeometry = 1004,

  /**
   * @brief A tile could not be downloaded or decoded.
   */
  TileFetchFailure = 1005,

  /**
   * @brief Images that must be combined have incompatible channel counts.
   */
  ChannelMismatch = 1006,

  /**
   * @brief An affine transform cannot be inverted.
   */
  DegenerateTransform = 1007
};

/**
 * @brief Gets the name of an {@link ErrorCode}, such as
 * `"TileBudgetExceeded"`.
 */
TESSERAUTILITY_API std::string_view errorCodeName(ErrorCode code) noexcept;

/**
 * @brief An exception carrying an {@link ErrorCode} in addition to a message.
 */
class TESSERAUTILITY_API CodedError : public std::runtime_error {
public:
  /**
   * @brief Constructs a new instance.
   *
   * @param code The kind of failure.
   * @param message A human-readable description of the failure.
   */
  CodedError(ErrorCode code, const std::string& message);

  /**
   * @brief Gets the kind of failure.
   */
  ErrorCode code() const noexcept { return this->_code; }

private:
  ErrorCode _code;
};

} // namespace TesseraUtility
