#pragma once

#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/Future.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraImagery/ImageAsset.h>
#include <TesseraImagery/Library.h>
#include <TesseraImagery/TileGrid.h>

#include <spdlog/fwd.h>

#include <memory>
#include <vector>

namespace TesseraAsync {
class IAssetRequest;
}

namespace TesseraImagery {

/**
 * @brief Downloads and decodes every tile of a {@link TileGrid}.
 *
 * All requests are issued at once. The result is all-or-nothing: if any tile
 * fails, the returned Future rejects and no partial mosaic is produced.
 */
class TESSERAIMAGERY_API TileFetcher final {
public:
  /**
   * @brief Creates a new instance.
   *
   * @param asyncSystem The async system used to run decoding in worker
   * threads.
   * @param pAssetAccessor The accessor used to download tiles.
   * @param pLogger The logger that receives fetch failures. If null, the
   * default spdlog logger is used.
   */
  TileFetcher(
      const TesseraAsync::AsyncSystem& asyncSystem,
      const std::shared_ptr<TesseraAsync::IAssetAccessor>& pAssetAccessor,
      const std::shared_ptr<spdlog::logger>& pLogger = nullptr);

  /**
   * @brief Fetches every tile of a grid.
   *
   * @param grid The tiles to fetch.
   * @param headers The headers to send with every request.
   * @return A Future that resolves to the decoded tiles in the grid's
   * row-major order, or rejects with a TesseraUtility::CodedError with
   * `ErrorCode::TileFetchFailure` naming the first tile that failed.
   */
  TesseraAsync::Future<std::vector<ImageAsset>> fetch(
      const TileGrid& grid,
      const std::vector<TesseraAsync::IAssetAccessor::THeader>& headers =
          {}) const;

  /**
   * @brief Decodes the response to a completed tile request.
   *
   * A missing response, a status code outside 2xx, an empty body and a body
   * that cannot be decoded are all failures. A status code of 0 is accepted
   * because `file:` URLs report no status.
   *
   * @throws TesseraUtility::CodedError with `ErrorCode::TileFetchFailure`.
   */
  static ImageAsset decodeResponse(const TesseraAsync::IAssetRequest& request);

private:
  TesseraAsync::AsyncSystem _asyncSystem;
  std::shared_ptr<TesseraAsync::IAssetAccessor> _pAssetAccessor;
  std::shared_ptr<spdlog::logger> _pLogger;
};

} // namespace TesseraImagery
