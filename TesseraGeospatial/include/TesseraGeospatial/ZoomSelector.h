#pragma once

#include <TesseraGeometry/TileRange.h>
#include <TesseraGeospatial/Bounds.h>
#include <TesseraGeospatial/Library.h>

#include <spdlog/fwd.h>

#include <cstdint>
#include <memory>
#include <optional>

namespace TesseraGeospatial {

/**
 * @brief Options for {@link ZoomSelector}.
 */
struct TESSERAGEOSPATIAL_API ZoomSelectorOptions {
  /**
   * @brief The largest number of tiles a selected grid may contain.
   */
  int64_t maximumTileCount = 100;

  /**
   * @brief The zoom level at which the adaptive search starts.
   */
  int32_t initialSearchZoom = 22;

  /**
   * @brief The lowest zoom level that may be selected.
   */
  int32_t minimumZoom = 0;

  /**
   * @brief The highest zoom level that may be selected.
   */
  int32_t maximumZoom = 30;

  /**
   * @brief The adaptive search stops once the grid has at most this many
   * columns and rows.
   */
  int32_t searchThreshold = 2;
};

/**
 * @brief Chooses the zoom level and tile range used to cover a bounding box.
 *
 * With an explicit zoom level the range at that zoom is used as-is. Otherwise
 * the search starts at {@link ZoomSelectorOptions::initialSearchZoom} and
 * steps down one level at a time until the range is at most
 * {@link ZoomSelectorOptions::searchThreshold} tiles in both directions, or
 * the minimum zoom is reached.
 *
 * In both cases the final range is checked against
 * {@link ZoomSelectorOptions::maximumTileCount}.
 */
class TESSERAGEOSPATIAL_API ZoomSelector final {
public:
  /**
   * @brief Creates a new instance.
   *
   * @param options The options.
   * @param pLogger The logger that receives the zoom decisions. If null, the
   * default spdlog logger is used.
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * the options are inconsistent.
   */
  explicit ZoomSelector(
      const ZoomSelectorOptions& options = {},
      const std::shared_ptr<spdlog::logger>& pLogger = nullptr);

  /**
   * @brief Selects the tile range covering a bounding box.
   *
   * @param bounds The bounding box, in degrees.
   * @param zoom An explicit zoom level, or `std::nullopt` to search for one.
   * @param requiresSquare Whether the range must have as many rows as
   * columns. The shorter side is grown around the box.
   * @return The selected range; its `z` is the selected zoom.
   * @throws TesseraUtility::CodedError with `ErrorCode::InvalidArgument` if
   * the explicit zoom is outside the allowed range,
   * `ErrorCode::InvalidGeometry` if the bounds are inverted, or
   * `ErrorCode::TileBudgetExceeded` if the range has too many tiles.
   */
  TesseraGeometry::TileRange select(
      const Bounds& bounds,
      std::optional<int32_t> zoom = std::nullopt,
      bool requiresSquare = false) const;

  /**
   * @brief Throws `ErrorCode::TileBudgetExceeded` if the range has more than
   * `maximumTileCount` tiles.
   */
  static void
  checkTileBudget(const TesseraGeometry::TileRange& range, int64_t maximumTileCount);

  /**
   * @brief Gets the options.
   */
  const ZoomSelectorOptions& getOptions() const noexcept {
    return this->_options;
  }

private:
  TesseraGeometry::TileRange searchZoom(const Bounds& bounds) const;

  ZoomSelectorOptions _options;
  std::shared_ptr<spdlog::logger> _pLogger;
};

} // namespace TesseraGeospatial
