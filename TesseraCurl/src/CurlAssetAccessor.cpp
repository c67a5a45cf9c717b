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


// The curl headers include Windows headers. Don't let Windows create `min` and
// `max` #defines.
#define NOMINMAX

#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/HttpHeaders.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraAsync/IAssetRequest.h>
#include <TesseraAsync/IAssetResponse.h>
#include <TesseraCurl/CurlAssetAccessor.h>

#include <curl/curl.h>
#include <curl/easy.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace TesseraAsync;

namespace TesseraCurl {

const auto CURL_BUFFERSIZE = 3145728L; // 3 MiB

// Reusing easy handles lets libcurl keep connections to the tile server open
// across requests.
struct CurlAssetAccessor::CurlCache {
  struct CacheEntry {
    CacheEntry() : curl(nullptr), free(false) {}
    CacheEntry(CURL* curl_, bool free_) : curl(curl_), free(free_) {}
    CURL* curl;
    bool free;
  };

  std::mutex cacheMutex;
  std::vector<CacheEntry> cache;

  ~CurlCache() {
    for (auto& entry : cache) {
      curl_easy_cleanup(entry.curl);
    }
  }

  CURL* get() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    for (auto& entry : cache) {
      if (entry.free) {
        entry.free = false;
        return entry.curl;
      }
    }
    CURL* curl = curl_easy_init();
    if (!curl) {
      throw std::runtime_error("curl_easy_init failed");
    }
    cache.emplace_back(curl, false);
    return curl;
  }

  void release(CURL* curl) {
    std::lock_guard<std::mutex> lock(cacheMutex);
    for (auto& entry : cache) {
      if (curl == entry.curl) {
        curl_easy_reset(curl);
        entry.free = true;
        return;
      }
    }
    throw std::logic_error("releasing a curl handle that is not in the cache");
  }
};

// Checks a handle out of the CurlCache for the lifetime of this object.
class CurlAssetAccessor::CurlHandle {
public:
  CurlHandle(CurlAssetAccessor* accessor)
      : _accessor(accessor), _curl(accessor->_pCurlCache->get()) {}

  ~CurlHandle() {
    if (this->_accessor) {
      this->_accessor->_pCurlCache->release(this->_curl);
    }
  }

  CURL* operator()() const { return this->_curl; }

  CurlHandle(const CurlHandle& rhs) = delete;
  CurlHandle& operator=(const CurlHandle& rhs) = delete;

private:
  CurlAssetAccessor* _accessor;
  CURL* _curl;
};

namespace {

class CurlAssetResponse final : public IAssetResponse {
public:
  [[nodiscard]] uint16_t statusCode() const override { return _statusCode; }

  [[nodiscard]] std::string contentType() const override {
    return _contentType;
  }

  [[nodiscard]] const HttpHeaders& headers() const override { return _headers; }

  [[nodiscard]] std::span<const std::byte> data() const override {
    return {this->_result.data(), this->_result.size()};
  }

  static size_t
  headerCallback(char* buffer, size_t size, size_t nitems, void* userData);
  static size_t
  dataCallback(char* buffer, size_t size, size_t nitems, void* userData);
  void setCallbacks(CURL* curl);

  uint16_t _statusCode = 0;
  std::string _contentType;
  HttpHeaders _headers;
  std::vector<std::byte> _result;
};

class CurlAssetRequest final : public IAssetRequest {
public:
  CurlAssetRequest(
      const std::string& url,
      const std::vector<IAssetAccessor::THeader>& thisRequestHeaders,
      const std::vector<IAssetAccessor::THeader>& accessorRequestHeaders)
      : _method("GET"), _url(url) {
    // `insert` skips keys that already exist, so the request's own headers
    // win over the accessor defaults.
    this->_headers.insert(thisRequestHeaders.begin(), thisRequestHeaders.end());
    this->_headers.insert(
        accessorRequestHeaders.begin(),
        accessorRequestHeaders.end());
  }

  [[nodiscard]] const std::string& method() const override {
    return this->_method;
  }

  [[nodiscard]] const std::string& url() const override { return this->_url; }

  [[nodiscard]] const HttpHeaders& headers() const override {
    return this->_headers;
  }

  [[nodiscard]] const IAssetResponse* response() const override {
    return this->_response.get();
  }

  void setResponse(std::unique_ptr<CurlAssetResponse> response) {
    this->_response = std::move(response);
  }

private:
  std::string _method;
  std::string _url;
  HttpHeaders _headers;
  std::unique_ptr<CurlAssetResponse> _response;
};

/*static*/ size_t CurlAssetResponse::headerCallback(
    char* buffer,
    size_t size,
    size_t nitems,
    void* userData) {
  const size_t cnt = size * nitems;
  auto* response = static_cast<CurlAssetResponse*>(userData);
  if (!response) {
    return cnt;
  }
  auto* colon = static_cast<char*>(std::memchr(buffer, ':', cnt));
  if (colon) {
    char* value = colon + 1;
    auto* end = std::find(value, buffer + cnt, '\r');
    while (value < end && *value == ' ') {
      ++value;
    }
    response->_headers.insert(
        {std::string(buffer, colon), std::string(value, end)});
    auto contentTypeItr = response->_headers.find("content-type");
    if (contentTypeItr != response->_headers.end()) {
      response->_contentType = contentTypeItr->second;
    }
  }
  return cnt;
}

/*static*/ size_t CurlAssetResponse::dataCallback(
    char* buffer,
    size_t size,
    size_t nitems,
    void* userData) {
  const size_t cnt = size * nitems;
  auto* response = static_cast<CurlAssetResponse*>(userData);
  if (!response) {
    return cnt;
  }
  std::transform(
      buffer,
      buffer + cnt,
      std::back_inserter(response->_result),
      [](char c) { return std::byte{static_cast<unsigned char>(c)}; });
  return cnt;
}

void CurlAssetResponse::setCallbacks(CURL* curl) {
  curl_easy_setopt(
      curl,
      CURLOPT_WRITEFUNCTION,
      CurlAssetResponse::dataCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
  curl_easy_setopt(
      curl,
      CURLOPT_HEADERFUNCTION,
      CurlAssetResponse::headerCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
}

curl_slist* setCommonOptions(
    CURL* curl,
    const std::string& url,
    const HttpHeaders& headers,
    const CurlAssetAccessorOptions& options) {
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  if (!options.certificateFile.empty()) {
    curl_easy_setopt(curl, CURLOPT_CAINFO, options.certificateFile.c_str());
  }
  if (!options.certificatePath.empty()) {
    curl_easy_setopt(curl, CURLOPT_CAPATH, options.certificatePath.c_str());
  }
  curl_easy_setopt(curl, CURLOPT_SSL_OPTIONS, CURLSSLOPT_NATIVE_CA);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, CURL_BUFFERSIZE);
  curl_easy_setopt(curl, CURLOPT_MAXCONNECTS, 20L);
  curl_easy_setopt(curl, CURLOPT_DNS_CACHE_TIMEOUT, 300L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, options.timeoutSeconds);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_slist* list = nullptr;
  for (const auto& header : headers) {
    std::string fullHeader = header.first + ":" + header.second;
    list = curl_slist_append(list, fullHeader.c_str());
  }
  if (list) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
  }
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  return list;
}

} // namespace

CurlAssetAccessor::CurlAssetAccessor(const CurlAssetAccessorOptions& options)
    : _pCurlCache(std::make_unique<CurlCache>()), _options(options) {
  if (this->_options.doGlobalInit) {
    curl_global_init(CURL_GLOBAL_ALL);
  }
}

CurlAssetAccessor::~CurlAssetAccessor() {
  this->_pCurlCache.reset();
  if (this->_options.doGlobalInit) {
    curl_global_cleanup();
  }
}

const CurlAssetAccessorOptions& CurlAssetAccessor::getOptions() const {
  return this->_options;
}

Future<std::shared_ptr<IAssetRequest>> CurlAssetAccessor::get(
    const AsyncSystem& asyncSystem,
    const std::string& url,
    const std::vector<IAssetAccessor::THeader>& headers) {
  return asyncSystem.runInWorkerThread(
      [url,
       headers,
       pThis = this->shared_from_this()]() -> std::shared_ptr<IAssetRequest> {
        std::shared_ptr<CurlAssetRequest> pRequest =
            std::make_shared<CurlAssetRequest>(
                url,
                headers,
                pThis->_options.requestHeaders);

        CurlHandle curl(pThis.get());
        curl_slist* list = setCommonOptions(
            curl(),
            pRequest->url(),
            pRequest->headers(),
            pThis->_options);
        std::unique_ptr<CurlAssetResponse> pResponse =
            std::make_unique<CurlAssetResponse>();
        pResponse->setCallbacks(curl());
        CURLcode responseCode = curl_easy_perform(curl());
        curl_slist_free_all(list);
        if (responseCode != CURLE_OK) {
          throw std::runtime_error(fmt::format(
              "{} `{}` failed: {}",
              pRequest->method(),
              pRequest->url(),
              curl_easy_strerror(responseCode)));
        }

        // NOLINTNEXTLINE(google-runtime-int)
        long httpResponseCode = 0;
        curl_easy_getinfo(curl(), CURLINFO_RESPONSE_CODE, &httpResponseCode);
        pResponse->_statusCode = static_cast<uint16_t>(httpResponseCode);
        char* ct = nullptr;
        curl_easy_getinfo(curl(), CURLINFO_CONTENT_TYPE, &ct);
        if (ct) {
          pResponse->_contentType = ct;
        }
        pRequest->setResponse(std::move(pResponse));
        return pRequest;
      });
}

void CurlAssetAccessor::tick() noexcept {}

} // namespace TesseraCurl
