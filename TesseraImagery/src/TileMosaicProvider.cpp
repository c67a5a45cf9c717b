#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/Future.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraAsync/Promise.h>
#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraGeospatial/GeoJsonReader.h>
#include <TesseraGeospatial/ZoomSelector.h>
#include <TesseraImagery/GeoRaster.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/MosaicStitcher.h>
#include <TesseraImagery/TileFetcher.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraImagery/TileGridBuilder.h>
#include <TesseraImagery/TileMosaicProvider.h>
#include <TesseraImagery/TileUrlStrategy.h>
#include <TesseraUtility/CodedError.h>
#include <TesseraUtility/Result.h>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace TesseraAsync;
using namespace TesseraGeometry;
using namespace TesseraGeospatial;
using namespace TesseraUtility;

namespace TesseraImagery {

namespace {
Future<GeoRaster>
createRejectedFuture(const AsyncSystem& asyncSystem, const CodedError& error) {
  Promise<GeoRaster> promise = asyncSystem.createPromise<GeoRaster>();
  promise.reject(error);
  return promise.getFuture();
}
} // namespace

TileMosaicProvider::TileMosaicProvider(
    const AsyncSystem& asyncSystem,
    const std::shared_ptr<IAssetAccessor>& pAssetAccessor,
    const ProviderOptions& providerOptions,
    const TileMosaicOptions& options,
    const std::shared_ptr<spdlog::logger>& pLogger)
    : _asyncSystem(asyncSystem),
      _pAssetAccessor(pAssetAccessor),
      _strategy(TileUrlStrategy::create(providerOptions)),
      _options(options),
      _zoomSelector(options.zoom, pLogger),
      _pLogger(pLogger ? pLogger : spdlog::default_logger()) {}

TileGrid TileMosaicProvider::getTileGrid(
    const GeoJsonFeature& polygon,
    const std::vector<int32_t>& bands,
    const std::optional<std::string>& expression,
    std::optional<int32_t> zoomLevel,
    bool requiresSquare) const {
  const Bounds bounds = computeBounds(polygon);
  const TileRange range =
      this->_zoomSelector.select(bounds, zoomLevel, requiresSquare);
  return TileGridBuilder::build(
      range,
      this->_strategy,
      TileUrlContext{bands, expression});
}

Future<GeoRaster> TileMosaicProvider::getImage(
    const GeoJsonFeature& polygon,
    const std::vector<int32_t>& bands,
    const std::optional<std::string>& expression,
    std::optional<int32_t> zoomLevel,
    bool requiresSquare) const {
  std::optional<TileGrid> maybeGrid;
  try {
    maybeGrid.emplace(this->getTileGrid(
        polygon,
        bands,
        expression,
        zoomLevel,
        requiresSquare));
  } catch (const CodedError& e) {
    SPDLOG_LOGGER_ERROR(
        this->_pLogger,
        "Cannot get {} imagery: {}",
        this->_strategy.getProviderName(),
        e.what());
    return createRejectedFuture(this->_asyncSystem, e);
  }

  SPDLOG_LOGGER_DEBUG(
      this->_pLogger,
      "Fetching {} tiles from {} at zoom {}.",
      maybeGrid->getCells().size(),
      this->_strategy.getProviderName(),
      maybeGrid->getZoom());

  TileFetcher fetcher(this->_asyncSystem, this->_pAssetAccessor, this->_pLogger);
  Future<std::vector<ImageAsset>> tiles =
      fetcher.fetch(*maybeGrid, this->_strategy.getRequestHeaders());

  return std::move(tiles).thenInWorkerThread(
      [grid = std::move(*maybeGrid), channels = this->_options.channels](
          std::vector<ImageAsset>&& images) {
        StitchedMosaic mosaic = MosaicStitcher::stitch(grid, images, channels);
        return GeoRaster(std::move(mosaic.image), mosaic.bounds);
      });
}

Future<GeoRaster> TileMosaicProvider::getImage(
    std::string_view geoJson,
    const std::vector<int32_t>& bands,
    const std::optional<std::string>& expression,
    std::optional<int32_t> zoomLevel,
    bool requiresSquare) const {
  Result<GeoJsonFeature> result = GeoJsonReader::readFeature(geoJson);
  result.errors.log(this->_pLogger, "Problems reading the GeoJSON polygon:");
  if (!result.value) {
    return createRejectedFuture(
        this->_asyncSystem,
        CodedError(
            ErrorCode::InvalidGeometry,
            result.errors.format("Failed to read the GeoJSON polygon:")));
  }

  return this->getImage(
      *result.value,
      bands,
      expression,
      zoomLevel,
      requiresSquare);
}

} // namespace TesseraImagery
