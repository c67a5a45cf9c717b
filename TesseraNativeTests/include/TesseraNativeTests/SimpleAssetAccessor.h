#pragma once

#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraAsync/IAssetRequest.h>
#include <TesseraNativeTests/SimpleAssetRequest.h>
#include <TesseraNativeTests/SimpleAssetResponse.h>

#include <doctest/doctest.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace TesseraNativeTests {
/**
 * Serves canned requests keyed by URL. Every `get` is recorded, together with
 * the headers it was sent with, so tests can inspect what was requested.
 */
class SimpleAssetAccessor : public TesseraAsync::IAssetAccessor {
public:
  SimpleAssetAccessor(
      std::map<std::string, std::shared_ptr<SimpleAssetRequest>>&&
          mockCompletedRequests)
      : mockCompletedRequests{std::move(mockCompletedRequests)} {}

  virtual TesseraAsync::Future<std::shared_ptr<TesseraAsync::IAssetRequest>>
  get(const TesseraAsync::AsyncSystem& asyncSystem,
      const std::string& url,
      const std::vector<THeader>& headers) override {
    {
      std::lock_guard<std::mutex> lock(this->mutex);
      this->requestedUrls.emplace_back(url);
      this->lastHeaders = headers;
    }

    auto mockRequestIt = mockCompletedRequests.find(url);
    if (mockRequestIt != mockCompletedRequests.end()) {
      return asyncSystem.createResolvedFuture(
          std::shared_ptr<TesseraAsync::IAssetRequest>(mockRequestIt->second));
    }

    FAIL("Cannot find request for url " << url);

    return asyncSystem.createResolvedFuture(
        std::shared_ptr<TesseraAsync::IAssetRequest>(nullptr));
  }

  virtual void tick() noexcept override {}

  std::map<std::string, std::shared_ptr<SimpleAssetRequest>>
      mockCompletedRequests;
  std::mutex mutex;
  std::vector<std::string> requestedUrls;
  std::vector<THeader> lastHeaders;
};
} // namespace TesseraNativeTests
