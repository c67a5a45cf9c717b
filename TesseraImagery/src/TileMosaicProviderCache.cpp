#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraGeospatial/ZoomSelector.h>
#include <TesseraImagery/TileMosaicProvider.h>
#include <TesseraImagery/TileMosaicProviderCache.h>
#include <TesseraImagery/TileUrlStrategy.h>
#include <TesseraUtility/Hash.h>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>

using namespace TesseraAsync;
using namespace TesseraGeospatial;
using namespace TesseraUtility;

namespace TesseraImagery {

namespace {

template <typename T> size_t hashValue(const T& value) {
  return std::hash<T>{}(value);
}

struct ProviderOptionsHasher {
  size_t operator()(const MapboxOptions& options) const {
    return Hash::combine(
        hashValue(options.apiKey),
        hashValue(options.attribution));
  }

  size_t operator()(const GeobaseOptions& options) const {
    size_t result = hashValue(options.projectRef);
    result = Hash::combine(result, hashValue(options.cogImagery));
    result = Hash::combine(result, hashValue(options.apikey));
    return Hash::combine(result, hashValue(options.attribution));
  }

  size_t operator()(const EsriOptions& options) const {
    size_t result = hashValue(options.serviceUrl);
    result = Hash::combine(result, hashValue(options.serviceName));
    result = Hash::combine(result, hashValue(options.tileSize));
    return Hash::combine(result, hashValue(options.attribution));
  }

  size_t operator()(const TmsOptions& options) const {
    size_t result = hashValue(options.baseUrl);
    result = Hash::combine(result, hashValue(options.extension));
    result = Hash::combine(result, hashValue(options.apiKey));
    for (const IAssetAccessor::THeader& header : options.headers) {
      result = Hash::combine(result, hashValue(header.first));
      result = Hash::combine(result, hashValue(header.second));
    }
    return Hash::combine(result, hashValue(options.attribution));
  }
};

} // namespace

TileMosaicProviderCache::TileMosaicProviderCache(
    const AsyncSystem& asyncSystem,
    const std::shared_ptr<IAssetAccessor>& pAssetAccessor,
    const std::shared_ptr<spdlog::logger>& pLogger)
    : _asyncSystem(asyncSystem),
      _pAssetAccessor(pAssetAccessor),
      _pLogger(pLogger ? pLogger : spdlog::default_logger()),
      _mutex(),
      _providers() {}

std::shared_ptr<TileMosaicProvider> TileMosaicProviderCache::getOrCreate(
    std::string_view task,
    std::string_view modelId,
    const ProviderOptions& providerOptions,
    const TileMosaicOptions& options) {
  const size_t key = computeKey(task, modelId, providerOptions, options);

  std::lock_guard<std::mutex> lock(this->_mutex);

  auto it = this->_providers.find(key);
  if (it != this->_providers.end()) {
    return it->second.pProvider;
  }

  SPDLOG_LOGGER_DEBUG(
      this->_pLogger,
      "Creating a tile mosaic provider for task {} and model {}.",
      task,
      modelId);

  auto pProvider = std::make_shared<TileMosaicProvider>(
      this->_asyncSystem,
      this->_pAssetAccessor,
      providerOptions,
      options,
      this->_pLogger);
  this->_providers.emplace(key, CacheEntry{std::string(task), pProvider});
  return pProvider;
}

size_t TileMosaicProviderCache::invalidate(std::string_view task) {
  std::lock_guard<std::mutex> lock(this->_mutex);
  return std::erase_if(this->_providers, [task](const auto& item) {
    return item.second.task == task;
  });
}

void TileMosaicProviderCache::clear() {
  std::lock_guard<std::mutex> lock(this->_mutex);
  this->_providers.clear();
}

size_t TileMosaicProviderCache::size() const {
  std::lock_guard<std::mutex> lock(this->_mutex);
  return this->_providers.size();
}

/*static*/ size_t TileMosaicProviderCache::computeKey(
    std::string_view task,
    std::string_view modelId,
    const ProviderOptions& providerOptions,
    const TileMosaicOptions& options) {
  size_t result = hashValue(task);
  result = Hash::combine(result, hashValue(modelId));
  result = Hash::combine(result, providerOptions.index());
  result =
      Hash::combine(result, std::visit(ProviderOptionsHasher{}, providerOptions));

  const ZoomSelectorOptions& zoom = options.zoom;
  result = Hash::combine(result, hashValue(zoom.maximumTileCount));
  result = Hash::combine(result, hashValue(zoom.initialSearchZoom));
  result = Hash::combine(result, hashValue(zoom.minimumZoom));
  result = Hash::combine(result, hashValue(zoom.maximumZoom));
  result = Hash::combine(result, hashValue(zoom.searchThreshold));
  return Hash::combine(result, hashValue(options.channels));
}

} // namespace TesseraImagery
