#pragma once

#include <TesseraUtility/Library.h>

#include <cstddef>
#include <cstdint>

namespace TesseraUtility {

/**
 * @brief Contains functions for working with hashes.
 */
struct TESSERAUTILITY_API Hash {
  /**
   * @brief Combines two hash values, usually generated using `std::hash`, to
   * form a single hash value.
   *
   * @param first The first hash value.
   * @param second The second hash value.
   * @return A new hash value which is a combination of the two.
   */
  static size_t combine(size_t first, size_t second);
};

} // namespace TesseraUtility
