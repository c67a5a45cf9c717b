#pragma once

#include <TesseraAsync/HttpHeaders.h>
#include <TesseraAsync/IAssetResponse.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace TesseraNativeTests {
class SimpleAssetResponse : public TesseraAsync::IAssetResponse {
public:
  SimpleAssetResponse(
      uint16_t statusCode,
      const std::string& contentType,
      const TesseraAsync::HttpHeaders& headers,
      const std::vector<std::byte>& data)
      : mockStatusCode{statusCode},
        mockContentType{contentType},
        mockHeaders{headers},
        mockData{data} {}

  virtual uint16_t statusCode() const override { return this->mockStatusCode; }

  virtual std::string contentType() const override {
    return this->mockContentType;
  }

  virtual const TesseraAsync::HttpHeaders& headers() const override {
    return this->mockHeaders;
  }

  virtual std::span<const std::byte> data() const override {
    return std::span<const std::byte>(mockData.data(), mockData.size());
  }

  uint16_t mockStatusCode;
  std::string mockContentType;
  TesseraAsync::HttpHeaders mockHeaders;
  std::vector<std::byte> mockData;
};
} // namespace TesseraNativeTests
