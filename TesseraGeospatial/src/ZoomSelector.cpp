#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/TileCoordinateMapper.h>
#include <TesseraGeospatial/ZoomSelector.h>
#include <TesseraUtility/CodedError.h>

#include <fmt/format.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>

using namespace TesseraGeometry;
using namespace TesseraUtility;

namespace TesseraGeospatial {

ZoomSelector::ZoomSelector(
    const ZoomSelectorOptions& options,
    const std::shared_ptr<spdlog::logger>& pLogger)
    : _options(options),
      _pLogger(pLogger ? pLogger : spdlog::default_logger()) {
  if (options.minimumZoom < 0 || options.maximumZoom > 30 ||
      options.minimumZoom > options.maximumZoom) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "The zoom range [{}, {}] must lie within [0, 30].",
            options.minimumZoom,
            options.maximumZoom));
  }
  if (options.maximumTileCount < 1 || options.searchThreshold < 1) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "maximumTileCount ({}) and searchThreshold ({}) must be positive.",
            options.maximumTileCount,
            options.searchThreshold));
  }
}

TileRange ZoomSelector::select(
    const Bounds& bounds,
    std::optional<int32_t> zoom,
    bool requiresSquare) const {
  if (bounds.getNorth() < bounds.getSouth() ||
      bounds.getEast() < bounds.getWest()) {
    throw CodedError(
        ErrorCode::InvalidGeometry,
        fmt::format(
            "The bounding box (west {}, south {}, east {}, north {}) is "
            "inverted.",
            bounds.getWest(),
            bounds.getSouth(),
            bounds.getEast(),
            bounds.getNorth()));
  }

  if (zoom && (*zoom < this->_options.minimumZoom ||
               *zoom > this->_options.maximumZoom)) {
    throw CodedError(
        ErrorCode::InvalidArgument,
        fmt::format(
            "Zoom level {} is outside the allowed range [{}, {}].",
            *zoom,
            this->_options.minimumZoom,
            this->_options.maximumZoom));
  }

  TileRange range = zoom
                        ? TileCoordinateMapper::computeTileRange(bounds, *zoom)
                        : this->searchZoom(bounds);

  if (requiresSquare) {
    range = range.expandToSquare();
  }

  SPDLOG_LOGGER_DEBUG(
      this->_pLogger,
      "Selected zoom {}{} with a {}x{} tile grid.",
      range.z,
      zoom ? " (explicit)" : "",
      range.getColumns(),
      range.getRows());

  checkTileBudget(range, this->_options.maximumTileCount);
  return range;
}

/*static*/ void ZoomSelector::checkTileBudget(
    const TileRange& range,
    int64_t maximumTileCount) {
  const int64_t tileCount = range.getTileCount();
  if (tileCount > maximumTileCount) {
    throw CodedError(
        ErrorCode::TileBudgetExceeded,
        fmt::format(
            "Requested {} tiles, which exceeds the maximum allowed ({})",
            tileCount,
            maximumTileCount));
  }
}

TileRange ZoomSelector::searchZoom(const Bounds& bounds) const {
  int32_t zoom = std::clamp(
      this->_options.initialSearchZoom,
      this->_options.minimumZoom,
      this->_options.maximumZoom);
  TileRange range = TileCoordinateMapper::computeTileRange(bounds, zoom);

  while ((range.getColumns() > this->_options.searchThreshold ||
          range.getRows() > this->_options.searchThreshold) &&
         zoom > this->_options.minimumZoom) {
    --zoom;
    range = TileCoordinateMapper::computeTileRange(bounds, zoom);
  }

  return range;
}

} // namespace TesseraGeospatial
