#pragma once

#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraImagery/Library.h>
#include <TesseraImagery/TileMosaicProvider.h>
#include <TesseraImagery/TileUrlStrategy.h>

#include <spdlog/fwd.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace TesseraImagery {

/**
 * @brief Shares {@link TileMosaicProvider} instances between callers that
 * use the same task, model and provider configuration.
 *
 * A new provider is created whenever any of those parameters changes. This
 * class is thread-safe.
 */
class TESSERAIMAGERY_API TileMosaicProviderCache final {
public:
  /**
   * @brief Creates an empty cache. Providers it creates share the given
   * async system, accessor and logger.
   */
  TileMosaicProviderCache(
      const TesseraAsync::AsyncSystem& asyncSystem,
      const std::shared_ptr<TesseraAsync::IAssetAccessor>& pAssetAccessor,
      const std::shared_ptr<spdlog::logger>& pLogger = nullptr);

  /**
   * @brief Gets the provider for a configuration, creating it if it does not
   * exist yet.
   *
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * a new provider must be created and the options are invalid.
   */
  std::shared_ptr<TileMosaicProvider> getOrCreate(
      std::string_view task,
      std::string_view modelId,
      const ProviderOptions& providerOptions,
      const TileMosaicOptions& options = {});

  /**
   * @brief Removes every provider created for a task.
   *
   * Callers holding one of the removed providers may keep using it.
   *
   * @return The number of providers removed.
   */
  size_t invalidate(std::string_view task);

  /**
   * @brief Removes every provider.
   */
  void clear();

  /**
   * @brief Gets the number of cached providers.
   */
  size_t size() const;

  /**
   * @brief Computes the key identifying a configuration.
   */
  static size_t computeKey(
      std::string_view task,
      std::string_view modelId,
      const ProviderOptions& providerOptions,
      const TileMosaicOptions& options);

private:
  struct CacheEntry {
    std::string task;
    std::shared_ptr<TileMosaicProvider> pProvider;
  };

  TesseraAsync::AsyncSystem _asyncSystem;
  std::shared_ptr<TesseraAsync::IAssetAccessor> _pAssetAccessor;
  std::shared_ptr<spdlog::logger> _pLogger;

  mutable std::mutex _mutex;
  std::unordered_map<size_t, CacheEntry> _providers;
};

} // namespace TesseraImagery
