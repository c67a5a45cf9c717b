#pragma once

#include <TesseraAsync/Library.h>

#include <map>
#include <string>

namespace TesseraAsync {

/**
 * @brief A case-insensitive `less-than` string comparison, usable as the
 * `Compare` of a `std::map`. Non-ASCII characters are compared byte-wise.
 */
struct TESSERAASYNC_API CaseInsensitiveCompare {
  /** @brief Compares the two strings after lower-casing each character. */
  bool operator()(const std::string& s1, const std::string& s2) const;
};

/**
 * @brief HTTP headers keyed by case-insensitive header name.
 */
using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveCompare>;
} // namespace TesseraAsync
