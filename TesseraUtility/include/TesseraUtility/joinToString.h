#pragma once

#include <numeric>
#include <string>

namespace TesseraUtility {
/**
 * @brief Joins the elements of a range into a string, placing a separator
 * between successive elements.
 *
 * @param begin An iterator referring to the first element to join.
 * @param end An iterator referring to one past the last element to join.
 * @param separator The string placed between elements.
 * @return The joined string, or an empty string for an empty range.
 */
template <class TIterator>
std::string
joinToString(TIterator begin, TIterator end, const std::string& separator) {
  if (begin == end)
    return std::string();

  std::string first = *begin;

  return std::accumulate(
      ++begin,
      end,
      std::move(first),
      [&separator](const std::string& acc, const std::string& element) {
        return acc + separator + element;
      });
}

/**
 * @brief Joins every element of a collection into a string.
 *
 * @param collection The collection of elements to be joined.
 * @param separator The string placed between elements.
 * @return The joined string.
 */
template <class TCollection>
std::string
joinToString(const TCollection& collection, const std::string& separator) {
  return joinToString(collection.cbegin(), collection.cend(), separator);
}
} // namespace TesseraUtility
