#pragma once

#include <TesseraAsync/HttpHeaders.h>
#include <TesseraAsync/IAssetRequest.h>
#include <TesseraNativeTests/SimpleAssetResponse.h>

#include <memory>
#include <string>
#include <utility>

namespace TesseraNativeTests {
class SimpleAssetRequest : public TesseraAsync::IAssetRequest {
public:
  SimpleAssetRequest(
      const std::string& method,
      const std::string& url,
      const TesseraAsync::HttpHeaders& headers,
      std::unique_ptr<SimpleAssetResponse> pResponse)
      : requestMethod{method},
        requestUrl{url},
        requestHeaders{headers},
        pResponse{std::move(pResponse)} {}

  virtual const std::string& method() const override {
    return this->requestMethod;
  }

  virtual const std::string& url() const override { return this->requestUrl; }

  virtual const TesseraAsync::HttpHeaders& headers() const override {
    return this->requestHeaders;
  }

  virtual const TesseraAsync::IAssetResponse* response() const override {
    return this->pResponse.get();
  }

  std::string requestMethod;
  std::string requestUrl;
  TesseraAsync::HttpHeaders requestHeaders;
  std::unique_ptr<SimpleAssetResponse> pResponse;
};
} // namespace TesseraNativeTests
