#include <TesseraGeometry/TileCoord.h>
#include <TesseraUtility/Hash.h>

#include <cstddef>
#include <cstdint>
#include <functional>

namespace std {

size_t hash<TesseraGeometry::TileCoord>::operator()(
    const TesseraGeometry::TileCoord& key) const noexcept {
  std::hash<int32_t> h;
  size_t result = h(key.z);
  result = TesseraUtility::Hash::combine(result, h(key.x));
  result = TesseraUtility::Hash::combine(result, h(key.y));
  return result;
}

} // namespace std
