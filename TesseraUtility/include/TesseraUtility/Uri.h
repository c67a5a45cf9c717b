#pragma once

#include <TesseraUtility/Library.h>

#include <ada.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace TesseraUtility {

/**
 * @brief Parses absolute URLs and builds tile request URLs from templates.
 *
 * Parsing follows the [WhatWG URL specification](https://url.spec.whatwg.org/).
 */
class TESSERAUTILITY_API Uri final {
public:
  /**
   * @brief Attempts to parse an absolute URL. If the string fails to parse,
   * \ref isValid will return false.
   *
   * @param uri A string containing the URL to parse.
   */
  Uri(const std::string& uri);

  /**
   * @brief Returns the normalized string form of the URL, or an empty string
   * if it is not valid.
   */
  std::string_view toString() const;

  /**
   * @brief Returns true if this URL has been successfully parsed.
   */
  bool isValid() const;

  /**
   * @brief Equivalent to \ref isValid.
   */
  operator bool() const { return this->isValid(); }

  /**
   * @brief Gets the scheme portion of the URL, including the trailing colon,
   * such as `https:`.
   */
  std::string_view getScheme() const;

  /**
   * @brief Gets the host portion of the URL. Empty for `file:` URLs.
   */
  std::string_view getHost() const;

  /**
   * @brief Gets the path portion of the URL, including the leading slash.
   */
  std::string_view getPath() const;

  /**
   * @brief A callback to fill in a placeholder value in
   * {@link substituteTemplateParameters}.
   */
  typedef std::string
  SubstitutionCallbackSignature(const std::string& placeholder);

  /**
   * @brief Substitutes the placeholders in a templated URI with their
   * appropriate values obtained using a specified callback function.
   *
   * A placeholder is any text enclosed in braces, such as `{z}`. An unclosed
   * brace ends substitution and the rest of the template is copied as-is.
   *
   * @param templateUri The templated URI whose placeholders will be
   * substituted by this method.
   * @param substitutionCallback The callback that returns the text for each
   * placeholder name, without braces.
   * @return The URI with all placeholders substituted.
   */
  static std::string substituteTemplateParameters(
      const std::string& templateUri,
      const std::function<SubstitutionCallbackSignature>& substitutionCallback);

  /**
   * @brief Escapes a string so it can be used as a query parameter value,
   * using the `application/x-www-form-urlencoded` percent-encode set.
   */
  static std::string escape(const std::string& s);

  /**
   * @brief Reverses {@link escape}.
   */
  static std::string unescape(const std::string& s);

  /**
   * @brief Converts a native file system path to a `file:///` URL.
   */
  static std::string nativePathToFileUrl(const std::string& nativePath);

private:
  std::optional<ada::url_aggregator> _url;
};

} // namespace TesseraUtility
