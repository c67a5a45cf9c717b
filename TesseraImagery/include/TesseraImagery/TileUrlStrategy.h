#pragma once

#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraGeometry/TileCoord.h>
#include <TesseraImagery/Library.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace TesseraImagery {

/**
 * @brief Options for Mapbox satellite imagery.
 */
struct TESSERAIMAGERY_API MapboxOptions {
  /**
   * @brief The Mapbox access token. Required.
   */
  std::string apiKey;

  /**
   * @brief The attribution to display with the imagery.
   */
  std::string attribution{"© Mapbox"};
};

/**
 * @brief Options for a Cloud Optimized GeoTIFF served through a Geobase
 * project's tiler.
 */
struct TESSERAIMAGERY_API GeobaseOptions {
  /**
   * @brief The Geobase project reference, the first label of the project's
   * host name. Required.
   */
  std::string projectRef;

  /**
   * @brief The URL of the Cloud Optimized GeoTIFF. Required. It is placed in
   * the tile URL's query string as given.
   */
  std::string cogImagery;

  /**
   * @brief The Geobase API key. Required.
   */
  std::string apikey;

  /**
   * @brief The attribution to display with the imagery.
   */
  std::string attribution{"Geobase"};
};

/**
 * @brief Options for an ArcGIS MapServer tile service.
 */
struct TESSERAIMAGERY_API EsriOptions {
  /**
   * @brief The base URL of the ArcGIS REST services.
   */
  std::string serviceUrl{"https://server.arcgisonline.com/ArcGIS/rest/services"};

  /**
   * @brief The name of the MapServer service.
   */
  std::string serviceName{"World_Imagery"};

  /**
   * @brief The width and height of each tile, in pixels.
   */
  int32_t tileSize{256};

  /**
   * @brief The attribution to display with the imagery.
   */
  std::string attribution{"Esri World Imagery"};
};

/**
 * @brief Options for a Tile Map Service, whose rows are counted from the
 * bottom (south) edge of the map.
 */
struct TESSERAIMAGERY_API TmsOptions {
  /**
   * @brief The base URL, without the `{z}/{x}/{y}` path. Required.
   */
  std::string baseUrl;

  /**
   * @brief The file extension of each tile.
   */
  std::string extension{"jpg"};

  /**
   * @brief An API key appended as the `key` query parameter, if given.
   */
  std::optional<std::string> apiKey{};

  /**
   * @brief Headers to send with every tile request.
   */
  std::vector<TesseraAsync::IAssetAccessor::THeader> headers{};

  /**
   * @brief The attribution to display with the imagery.
   */
  std::string attribution{"TMS"};
};

/**
 * @brief The configuration of one of the supported imagery providers.
 */
using ProviderOptions =
    std::variant<MapboxOptions, GeobaseOptions, EsriOptions, TmsOptions>;

/**
 * @brief Per-request parameters that some providers add to tile URLs.
 */
struct TESSERAIMAGERY_API TileUrlContext {
  /**
   * @brief The 1-based band indices to request. Only Geobase uses these.
   */
  std::vector<int32_t> bands{};

  /**
   * @brief A band math expression such as `(b1-b2)/(b1+b2)`. Only Geobase
   * uses this.
   */
  std::optional<std::string> expression{};
};

/**
 * @brief Builds tile URLs, request headers and attribution for an imagery
 * provider.
 *
 * Instances are created from a {@link ProviderOptions} with {@link create},
 * which validates and normalizes the options.
 */
class TESSERAIMAGERY_API TileUrlStrategy final {
public:
  /**
   * @brief Creates the strategy for a provider.
   *
   * A trailing `/` is removed from base URLs.
   *
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if a
   * required option is empty or a base URL is not an absolute URL.
   */
  static TileUrlStrategy create(const ProviderOptions& options);

  /**
   * @brief Gets the URL of a tile. The coordinate's row counts from the top
   * of the map; providers that count from the bottom flip it.
   */
  std::string getTileUrl(
      const TesseraGeometry::TileCoord& coord,
      const TileUrlContext& context = {}) const;

  /**
   * @brief Gets the headers to send with every tile request.
   */
  const std::vector<TesseraAsync::IAssetAccessor::THeader>&
  getRequestHeaders() const noexcept {
    return this->_headers;
  }

  /**
   * @brief Gets the attribution to display with the imagery.
   */
  const std::string& getAttribution() const noexcept;

  /**
   * @brief Gets the expected width and height of a tile, in pixels.
   */
  int32_t getTileSize() const noexcept;

  /**
   * @brief Gets a short name for the provider: `mapbox`, `geobase`, `esri` or
   * `tms`.
   */
  std::string_view getProviderName() const noexcept;

  /**
   * @brief Gets the normalized options.
   */
  const ProviderOptions& getOptions() const noexcept { return this->_options; }

private:
  explicit TileUrlStrategy(ProviderOptions&& options);

  ProviderOptions _options;
  std::vector<TesseraAsync::IAssetAccessor::THeader> _headers;
};

} // namespace TesseraImagery
