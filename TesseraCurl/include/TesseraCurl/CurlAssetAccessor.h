/* <editor-fold desc="MIT License">

Copyright(c) 2023 Timothy Moore

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.

</editor-fold> */


#pragma once

#include <TesseraAsync/Future.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraAsync/IAssetRequest.h>
#include <TesseraCurl/Library.h>

#include <memory>
#include <string>
#include <vector>

namespace TesseraCurl {

/**
 * @brief Options for constructing a \ref CurlAssetAccessor.
 */
struct TESSERACURL_API CurlAssetAccessorOptions {
  /**
   * @brief The `User-Agent` header to include with each request.
   */
  std::string userAgent{"Mozilla/5.0 Tessera CurlAssetAccessor"};

  /**
   * @brief Request headers to automatically include in each request.
   *
   * Headers passed to \ref CurlAssetAccessor::get take precedence over these.
   */
  std::vector<TesseraAsync::IAssetAccessor::THeader> requestHeaders{};

  /**
   * @brief The maximum number of seconds a single transfer may take, or 0 for
   * no limit. Passed to libcurl as `CURLOPT_TIMEOUT`.
   */
  long timeoutSeconds{60};

  /**
   * @brief The path to TLS certificates. If non-empty, this will be provided to
   * libcurl as `CURLOPT_CAPATH`.
   */
  std::string certificatePath{};

  /**
   * @brief A file containing TLS certificates. If non-empty, this will be
   * provided to libcurl as `CURLOPT_CAINFO`.
   */
  std::string certificateFile{};

  /**
   * @brief Whether to call `curl_global_init(CURL_GLOBAL_ALL)` at construction
   * time and `curl_global_cleanup()` at destruction time.
   */
  bool doGlobalInit{true};
};

/**
 * @brief An implementation of `IAssetAccessor` that downloads tiles from HTTP
 * servers and reads `file:` URLs using libcurl.
 *
 * Transport failures reject the returned future. HTTP error statuses do not:
 * the request resolves and the caller inspects the status code.
 */
class TESSERACURL_API CurlAssetAccessor
    : public std::enable_shared_from_this<CurlAssetAccessor>,
      public TesseraAsync::IAssetAccessor {
public:
  /**
   * @brief Constructs a new instance.
   *
   * @param options The options with which to construct this instance.
   */
  CurlAssetAccessor(const CurlAssetAccessorOptions& options = {});
  ~CurlAssetAccessor() override;

  /**
   * @brief Gets the options that were used to construct this accessor.
   */
  const CurlAssetAccessorOptions& getOptions() const;

  /** @inheritdoc */
  TesseraAsync::Future<std::shared_ptr<TesseraAsync::IAssetRequest>>
  get(const TesseraAsync::AsyncSystem& asyncSystem,
      const std::string& url,
      const std::vector<TesseraAsync::IAssetAccessor::THeader>& headers)
      override;

  /** @inheritdoc */
  void tick() noexcept override;

private:
  struct CurlCache;
  class CurlHandle;

  std::unique_ptr<CurlCache> _pCurlCache;
  CurlAssetAccessorOptions _options;
};

} // namespace TesseraCurl
