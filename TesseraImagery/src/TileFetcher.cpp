#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/Future.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraAsync/IAssetRequest.h>
#include <TesseraAsync/IAssetResponse.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/ImageDecoder.h>
#include <TesseraImagery/TileFetcher.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraUtility/CodedError.h>
#include <TesseraUtility/ErrorList.h>

#include <fmt/format.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

using namespace TesseraAsync;
using namespace TesseraUtility;

namespace TesseraImagery {

namespace {
[[noreturn]] void throwFetchFailure(const std::string& url, ErrorList&& errors) {
  throw CodedError(
      ErrorCode::TileFetchFailure,
      errors.format(fmt::format("Failed to fetch tile {}:", url)));
}
} // namespace

TileFetcher::TileFetcher(
    const AsyncSystem& asyncSystem,
    const std::shared_ptr<IAssetAccessor>& pAssetAccessor,
    const std::shared_ptr<spdlog::logger>& pLogger)
    : _asyncSystem(asyncSystem),
      _pAssetAccessor(pAssetAccessor),
      _pLogger(pLogger ? pLogger : spdlog::default_logger()) {}

Future<std::vector<ImageAsset>> TileFetcher::fetch(
    const TileGrid& grid,
    const std::vector<IAssetAccessor::THeader>& headers) const {
  std::vector<Future<ImageAsset>> tiles;
  tiles.reserve(grid.getCells().size());

  for (const TileGridCell& cell : grid.getCells()) {
    tiles.emplace_back(
        this->_pAssetAccessor->get(this->_asyncSystem, cell.url, headers)
            .catchImmediately(
                [url = cell.url, pLogger = this->_pLogger](
                    std::exception&& e) -> std::shared_ptr<IAssetRequest> {
                  SPDLOG_LOGGER_ERROR(
                      pLogger,
                      "Image request for {} failed: {}",
                      url,
                      e.what());
                  throwFetchFailure(
                      url,
                      ErrorList::error(fmt::format(
                          "Image request for {} failed: {}",
                          url,
                          e.what())));
                })
            .thenInWorkerThread(
                [pLogger = this->_pLogger](
                    std::shared_ptr<IAssetRequest>&& pRequest) {
                  try {
                    return decodeResponse(*pRequest);
                  } catch (const CodedError& e) {
                    SPDLOG_LOGGER_ERROR(pLogger, e.what());
                    throw;
                  }
                }));
  }

  return this->_asyncSystem.all(std::move(tiles));
}

/*static*/ ImageAsset TileFetcher::decodeResponse(const IAssetRequest& request) {
  const IAssetResponse* pResponse = request.response();
  if (pResponse == nullptr) {
    throwFetchFailure(
        request.url(),
        ErrorList::error(
            fmt::format("Image request for {} failed.", request.url())));
  }

  if (pResponse->statusCode() != 0 &&
      (pResponse->statusCode() < 200 || pResponse->statusCode() >= 300)) {
    throwFetchFailure(
        request.url(),
        ErrorList::error(fmt::format(
            "Received response code {} for image {}.",
            pResponse->statusCode(),
            request.url())));
  }

  const std::span<const std::byte> data = pResponse->data();
  if (data.empty()) {
    throwFetchFailure(
        request.url(),
        ErrorList::error(
            fmt::format("Image response for {} is empty.", request.url())));
  }

  ImageReaderResult loadedImage = ImageDecoder::readImage(data);
  if (!loadedImage.image || !loadedImage.errors.empty()) {
    loadedImage.errors.push_back("Image url: " + request.url());
    throwFetchFailure(
        request.url(),
        ErrorList{
            std::move(loadedImage.errors),
            std::move(loadedImage.warnings)});
  }

  return std::move(*loadedImage.image);
}

} // namespace TesseraImagery
