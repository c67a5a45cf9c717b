#pragma once

#include <TesseraAsync/HttpHeaders.h>
#include <TesseraAsync/Library.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace TesseraAsync {

/**
 * @brief A completed response for a downloaded asset, such as an imagery tile.
 */
class TESSERAASYNC_API IAssetResponse {
public:
  virtual ~IAssetResponse() = default;

  /**
   * @brief Returns the HTTP response code, or 0 for schemes without one such
   * as `file:`.
   */
  virtual uint16_t statusCode() const = 0;

  /**
   * @brief Returns the HTTP content type.
   */
  virtual std::string contentType() const = 0;

  /**
   * @brief Returns the HTTP headers of the response.
   */
  virtual const HttpHeaders& headers() const = 0;

  /**
   * @brief Returns the body of this response.
   */
  virtual std::span<const std::byte> data() const = 0;
};

} // namespace TesseraAsync
