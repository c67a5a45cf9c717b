#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeospatial/TileCoordinateMapper.h>
#include <TesseraImagery/TileUrlStrategy.h>
#include <TesseraUtility/CodedError.h>
#include <TesseraUtility/Uri.h>

#include <fmt/format.h>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace TesseraAsync;
using namespace TesseraGeometry;
using namespace TesseraGeospatial;
using namespace TesseraUtility;

namespace TesseraImagery {

namespace {

const std::string MAPBOX_URL_TEMPLATE =
    "https://api.mapbox.com/v4/mapbox.satellite/{z}/{x}/{y}.png"
    "?access_token={accessToken}";

const std::string GEOBASE_URL_TEMPLATE =
    "https://{projectRef}.geobase.app/titiler/v1/cog/tiles/WebMercatorQuad/"
    "{z}/{x}/{y}?url={cogImagery}&apikey={apikey}";

void requireNonEmpty(
    const std::string& value,
    std::string_view provider,
    std::string_view name) {
  if (value.empty()) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format("The {} provider requires a non-empty {}.", provider, name));
  }
}

std::string normalizeBaseUrl(
    const std::string& url,
    std::string_view provider,
    std::string_view name) {
  requireNonEmpty(url, provider, name);

  std::string result = url;
  while (result.size() > 1 && result.back() == '/') {
    result.pop_back();
  }

  if (!Uri(result).isValid()) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "The {} provider's {} `{}` is not an absolute URL.",
            provider,
            name,
            url));
  }
  return result;
}

std::string substitute(
    const std::string& urlTemplate,
    const std::map<std::string, std::string>& placeholders) {
  return Uri::substituteTemplateParameters(
      urlTemplate,
      [&placeholders](const std::string& placeholder) {
        auto it = placeholders.find(placeholder);
        if (it != placeholders.end()) {
          return it->second;
        }
        return "{" + placeholder + "}";
      });
}

struct Normalizer {
  ProviderOptions operator()(const MapboxOptions& options) const {
    requireNonEmpty(options.apiKey, "Mapbox", "apiKey");
    return options;
  }

  ProviderOptions operator()(const GeobaseOptions& options) const {
    requireNonEmpty(options.projectRef, "Geobase", "projectRef");
    requireNonEmpty(options.cogImagery, "Geobase", "cogImagery");
    requireNonEmpty(options.apikey, "Geobase", "apikey");
    return options;
  }

  ProviderOptions operator()(const EsriOptions& options) const {
    EsriOptions result = options;
    result.serviceUrl = normalizeBaseUrl(options.serviceUrl, "ESRI", "serviceUrl");
    requireNonEmpty(options.serviceName, "ESRI", "serviceName");
    if (options.tileSize <= 0) {
      throw CodedError(
          ErrorCode::InvalidArgument,
          fmt::format(
              "The ESRI provider's tileSize must be positive, but is {}.",
              options.tileSize));
    }
    return result;
  }

  ProviderOptions operator()(const TmsOptions& options) const {
    TmsOptions result = options;
    result.baseUrl = normalizeBaseUrl(options.baseUrl, "TMS", "baseUrl");
    requireNonEmpty(options.extension, "TMS", "extension");
    if (result.apiKey && result.apiKey->empty()) {
      result.apiKey.reset();
    }
    return result;
  }
};

struct UrlBuilder {
  const TileCoord& coord;
  const TileUrlContext& context;

  std::string operator()(const MapboxOptions& options) const {
    return substitute(
        MAPBOX_URL_TEMPLATE,
        {{"x", std::to_string(coord.x)},
         {"y", std::to_string(coord.y)},
         {"z", std::to_string(coord.z)},
         {"accessToken", options.apiKey}});
  }

  std::string operator()(const GeobaseOptions& options) const {
    std::string url = substitute(
        GEOBASE_URL_TEMPLATE,
        {{"x", std::to_string(coord.x)},
         {"y", std::to_string(coord.y)},
         {"z", std::to_string(coord.z)},
         {"projectRef", options.projectRef},
         {"cogImagery", options.cogImagery},
         {"apikey", options.apikey}});

    for (int32_t band : context.bands) {
      url += fmt::format("&bidx={}", band);
    }
    if (context.expression && !context.expression->empty()) {
      url += "&expression=" + Uri::escape(*context.expression);
    }
    return url;
  }

  std::string operator()(const EsriOptions& options) const {
    return fmt::format(
        "{}/{}/MapServer/tile/{}/{}/{}",
        options.serviceUrl,
        options.serviceName,
        coord.z,
        coord.y,
        coord.x);
  }

  std::string operator()(const TmsOptions& options) const {
    std::string url = fmt::format(
        "{}/{}/{}/{}.{}",
        options.baseUrl,
        coord.z,
        coord.x,
        TileCoordinateMapper::flipRowOrigin(coord.y, coord.z),
        options.extension);
    if (options.apiKey) {
      url += "?key=" + *options.apiKey;
    }
    return url;
  }
};

} // namespace

/*static*/ TileUrlStrategy TileUrlStrategy::create(const ProviderOptions& options) {
  return TileUrlStrategy(std::visit(Normalizer{}, options));
}

TileUrlStrategy::TileUrlStrategy(ProviderOptions&& options)
    : _options(std::move(options)), _headers() {
  if (const TmsOptions* pTms = std::get_if<TmsOptions>(&this->_options)) {
    this->_headers = pTms->headers;
  }
}

std::string TileUrlStrategy::getTileUrl(
    const TileCoord& coord,
    const TileUrlContext& context) const {
  return std::visit(UrlBuilder{coord, context}, this->_options);
}

const std::string& TileUrlStrategy::getAttribution() const noexcept {
  return std::visit(
      [](const auto& options) -> const std::string& {
        return options.attribution;
      },
      this->_options);
}

int32_t TileUrlStrategy::getTileSize() const noexcept {
  if (const EsriOptions* pEsri = std::get_if<EsriOptions>(&this->_options)) {
    return pEsri->tileSize;
  }
  return 256;
}

std::string_view TileUrlStrategy::getProviderName() const noexcept {
  struct Name {
    std::string_view operator()(const MapboxOptions&) const { return "mapbox"; }
    std::string_view operator()(const GeobaseOptions&) const {
      return "geobase";
    }
    std::string_view operator()(const EsriOptions&) const { return "esri"; }
    std::string_view operator()(const TmsOptions&) const { return "tms"; }
  };
  return std::visit(Name{}, this->_options);
}

} // namespace TesseraImagery
