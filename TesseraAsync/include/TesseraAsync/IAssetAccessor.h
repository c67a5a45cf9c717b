#pragma once

#include <TesseraAsync/Future.h>
#include <TesseraAsync/IAssetRequest.h>
#include <TesseraAsync/Library.h>

#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace TesseraAsync {

class AsyncSystem;

/**
 * @brief Provides asynchronous access to assets, usually tile images
 * downloaded via HTTP.
 */
class TESSERAASYNC_API IAssetAccessor {
public:
  /**
   * @brief An HTTP header represented as a key/value pair.
   */
  typedef std::pair<std::string, std::string> THeader;

  virtual ~IAssetAccessor() = default;

  /**
   * @brief Starts a new GET request for the asset with the given URL.
   * The request proceeds asynchronously without blocking the calling thread.
   *
   * @param asyncSystem The async system used to do work in threads.
   * @param url The URL of the asset.
   * @param headers The headers to include in the request.
   * @return The in-progress asset request.
   */
  virtual Future<std::shared_ptr<IAssetRequest>>
  get(const AsyncSystem& asyncSystem,
      const std::string& url,
      const std::vector<THeader>& headers = {}) = 0;

  /**
   * @brief Ticks the asset accessor while the calling thread is blocked.
   *
   * Accessors that do not depend on the calling thread to dispatch requests
   * may do nothing here.
   */
  virtual void tick() noexcept = 0;

  /**
   * @brief Merges two vectors of HTTP headers. A header present in
   * `overrideHeaders` replaces a header of the same name in `baseHeaders`.
   *
   * @param baseHeaders The base set of HTTP headers.
   * @param overrideHeaders The headers that take precedence.
   * @returns The combined headers, base headers first.
   */
  static std::vector<THeader> mergeHeaders(
      const std::vector<THeader>& baseHeaders,
      const std::vector<THeader>& overrideHeaders) {
    std::vector<THeader> headers;
    headers.reserve(baseHeaders.size() + overrideHeaders.size());

    std::set<std::string> overrideHeaderNames;
    for (const auto& [name, value] : overrideHeaders) {
      overrideHeaderNames.emplace(name);
    }

    for (const auto& [name, value] : baseHeaders) {
      if (!overrideHeaderNames.contains(name)) {
        headers.emplace_back(name, value);
      }
    }

    for (const auto& pair : overrideHeaders) {
      headers.emplace_back(pair);
    }

    return headers;
  }
};

} // namespace TesseraAsync
