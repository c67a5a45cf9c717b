#include <TesseraGeometry/TileCoord.h>
#include <TesseraGeometry/TileRange.h>

#include <algorithm>
#include <cstdint>

namespace TesseraGeometry {

namespace {
// Grows [minimum, maximum] by `extra` indices, split evenly between the two
// ends and kept within [0, limit].
void growAxis(int32_t& minimum, int32_t& maximum, int64_t extra, int64_t limit) {
  int64_t low = int64_t(minimum) - extra / 2;
  int64_t high = int64_t(maximum) + (extra - extra / 2);

  if (low < 0) {
    high += -low;
    low = 0;
  }
  if (high > limit) {
    low -= high - limit;
    high = limit;
  }

  minimum = static_cast<int32_t>(std::max<int64_t>(low, 0));
  maximum = static_cast<int32_t>(high);
}
} // namespace

/*static*/ TileRange
TileRange::fromCorners(const TileCoord& a, const TileCoord& b) noexcept {
  return TileRange{
      a.z,
      std::min(a.x, b.x),
      std::min(a.y, b.y),
      std::max(a.x, b.x),
      std::max(a.y, b.y)};
}

TileRange TileRange::expandToSquare() const noexcept {
  TileRange result = *this;
  const int64_t limit = TileCoord::tilesAtZoom(this->z) - 1;
  const int32_t columns = this->getColumns();
  const int32_t rows = this->getRows();

  if (columns < rows) {
    growAxis(result.minimumX, result.maximumX, rows - columns, limit);
  } else if (rows < columns) {
    growAxis(result.minimumY, result.maximumY, columns - rows, limit);
  }

  return result;
}

} // namespace TesseraGeometry
