#pragma once

#include <TesseraAsync/HttpHeaders.h>
#include <TesseraAsync/Library.h>

#include <string>

namespace TesseraAsync {

class IAssetResponse;

/**
 * @brief An asynchronous request for an asset, usually a file downloaded via
 * HTTP. All accessors may be called from any thread.
 */
class TESSERAASYNC_API IAssetRequest {
public:
  virtual ~IAssetRequest() = default;

  /** @brief Gets the request's method. */
  virtual const std::string& method() const = 0;

  /** @brief Gets the requested URL. */
  virtual const std::string& url() const = 0;

  /** @brief Gets the request's headers. */
  virtual const HttpHeaders& headers() const = 0;

  /**
   * @brief Gets the response, or nullptr if the request is still in progress
   * or failed before a response was received.
   */
  virtual const IAssetResponse* response() const = 0;
};

} // namespace TesseraAsync
