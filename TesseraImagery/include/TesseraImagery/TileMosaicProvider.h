#pragma once

#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/Future.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraGeospatial/GeoJsonFeature.h>
#include <TesseraGeospatial/ZoomSelector.h>
#include <TesseraImagery/GeoRaster.h>
#include <TesseraImagery/Library.h>
#include <TesseraImagery/TileGrid.h>
#include <TesseraImagery/TileUrlStrategy.h>

#include <spdlog/fwd.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TesseraImagery {

/**
 * @brief Options for {@link TileMosaicProvider}.
 */
struct TESSERAIMAGERY_API TileMosaicOptions {
  /**
   * @brief Options controlling how the zoom level is chosen, including the
   * maximum number of tiles per request.
   */
  TesseraGeospatial::ZoomSelectorOptions zoom{};

  /**
   * @brief The number of channels of the delivered rasters.
   */
  int32_t channels = 3;
};

/**
 * @brief Produces a georeferenced image of the area under a polygon by
 * downloading and stitching slippy-map tiles from an imagery provider.
 */
class TESSERAIMAGERY_API TileMosaicProvider final {
public:
  /**
   * @brief Creates a new instance.
   *
   * @param asyncSystem The async system used for downloading and stitching.
   * @param pAssetAccessor The accessor used to download tiles.
   * @param providerOptions The imagery provider.
   * @param options The options.
   * @param pLogger The logger that receives zoom decisions and failures. If
   * null, the default spdlog logger is used.
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * the provider or zoom options are invalid.
   */
  TileMosaicProvider(
      const TesseraAsync::AsyncSystem& asyncSystem,
      const std::shared_ptr<TesseraAsync::IAssetAccessor>& pAssetAccessor,
      const ProviderOptions& providerOptions,
      const TileMosaicOptions& options = {},
      const std::shared_ptr<spdlog::logger>& pLogger = nullptr);

  /**
   * @brief Gets an image of the area covered by a polygon.
   *
   * The bounding box of the polygon selects the zoom level and the tiles,
   * which are downloaded concurrently and stitched together. The delivered
   * raster's bounds are the union of the tiles' footprints, so they contain
   * the polygon's bounding box.
   *
   * @param polygon The area of interest.
   * @param bands The bands to request, for providers that support them.
   * @param expression A band math expression, for providers that support it.
   * @param zoomLevel An explicit zoom level, or `std::nullopt` to choose one
   * automatically.
   * @param requiresSquare Whether the image must be as wide as it is high.
   * @return A Future that resolves to the raster. It rejects with a
   * TesseraUtility::CodedError if the polygon is invalid, the tile budget is
   * exceeded, a tile fails to download or decode, or the tiles cannot be
   * stitched. Polygon and budget failures reject before any request is made.
   */
  TesseraAsync::Future<GeoRaster> getImage(
      const TesseraGeospatial::GeoJsonFeature& polygon,
      const std::vector<int32_t>& bands = {},
      const std::optional<std::string>& expression = std::nullopt,
      std::optional<int32_t> zoomLevel = std::nullopt,
      bool requiresSquare = false) const;

  /**
   * @brief Gets an image of the area covered by a polygon given as GeoJSON
   * text, either a Feature or a bare geometry.
   *
   * @copydetails getImage
   */
  TesseraAsync::Future<GeoRaster> getImage(
      std::string_view geoJson,
      const std::vector<int32_t>& bands = {},
      const std::optional<std::string>& expression = std::nullopt,
      std::optional<int32_t> zoomLevel = std::nullopt,
      bool requiresSquare = false) const;

  /**
   * @brief Gets the tiles that {@link getImage} would download, without
   * downloading them.
   *
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidGeometry` or
   * `ErrorCode::TileBudgetExceeded`.
   */
  TileGrid getTileGrid(
      const TesseraGeospatial::GeoJsonFeature& polygon,
      const std::vector<int32_t>& bands = {},
      const std::optional<std::string>& expression = std::nullopt,
      std::optional<int32_t> zoomLevel = std::nullopt,
      bool requiresSquare = false) const;

  /**
   * @brief Gets the strategy that builds tile URLs.
   */
  const TileUrlStrategy& getUrlStrategy() const noexcept {
    return this->_strategy;
  }

  /**
   * @brief Gets the attribution to display with the imagery.
   */
  const std::string& getAttribution() const noexcept {
    return this->_strategy.getAttribution();
  }

  /**
   * @brief Gets the options.
   */
  const TileMosaicOptions& getOptions() const noexcept {
    return this->_options;
  }

private:
  TesseraAsync::AsyncSystem _asyncSystem;
  std::shared_ptr<TesseraAsync::IAssetAccessor> _pAssetAccessor;
  TileUrlStrategy _strategy;
  TileMosaicOptions _options;
  TesseraGeospatial::ZoomSelector _zoomSelector;
  std::shared_ptr<spdlog::logger> _pLogger;
};

} // namespace TesseraImagery
