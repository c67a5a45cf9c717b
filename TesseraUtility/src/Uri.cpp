#include <TesseraUtility/Uri.h>

#include <ada/character_sets-inl.h>
#include <ada/implementation.h>
#include <ada/unicode.h>
#include <ada/url_aggregator.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace TesseraUtility {

namespace {
const std::string FILE_URL_PREFIX = "file://";
const char WINDOWS_PATH_SEP = '\\';
const char PATH_SEP = '/';

bool isAsciiAlpha(unsigned char c) {
  return c >= 0x41 && c <= 0x7a && (c <= 0x5a || c >= 0x61);
}
} // namespace

Uri::Uri(const std::string& uri) {
  ada::result<ada::url_aggregator> result = ada::parse(uri);
  if (result) {
    this->_url.emplace(std::move(result.value()));
  }
}

std::string_view Uri::toString() const {
  if (!this->_url) {
    return std::string_view();
  }

  return this->_url->get_href();
}

bool Uri::isValid() const { return this->_url.has_value(); }

std::string_view Uri::getScheme() const {
  if (!this->_url) {
    return {};
  }

  return this->_url->get_protocol();
}

std::string_view Uri::getHost() const {
  if (!this->_url) {
    return {};
  }

  return this->_url->get_host();
}

std::string_view Uri::getPath() const {
  if (!this->_url) {
    return {};
  }

  return this->_url->get_pathname();
}

/*static*/ std::string Uri::substituteTemplateParameters(
    const std::string& templateUri,
    const std::function<SubstitutionCallbackSignature>& substitutionCallback) {
  std::string result;
  result.reserve(templateUri.size());

  size_t startPos = 0;
  size_t nextPos;

  while ((nextPos = templateUri.find('{', startPos)) != std::string::npos) {
    result.append(templateUri, startPos, nextPos - startPos);

    const size_t endPos = templateUri.find('}', nextPos + 1);
    if (endPos == std::string::npos) {
      startPos = nextPos;
      break;
    }

    result.append(substitutionCallback(
        templateUri.substr(nextPos + 1, endPos - nextPos - 1)));

    startPos = endPos + 1;
  }

  result.append(templateUri, startPos, templateUri.length() - startPos);

  return result;
}

/*static*/ std::string Uri::escape(const std::string& s) {
  return ada::unicode::percent_encode(
      s,
      ada::character_sets::WWW_FORM_URLENCODED_PERCENT_ENCODE);
}

/*static*/ std::string Uri::unescape(const std::string& s) {
  return ada::unicode::percent_decode(s, s.find('%'));
}

/*static*/ std::string Uri::nativePathToFileUrl(const std::string& nativePath) {
  const std::string encoded = ada::unicode::percent_encode(
      nativePath,
      ada::character_sets::PATH_PERCENT_ENCODE);

  std::string output = FILE_URL_PREFIX;
  output.reserve(output.length() + encoded.length() + 1);

  // Paths like C:/... need a leading separator to form file:///C:/...
  const bool startsWithDriveLetter =
      encoded.length() >= 2 &&
      isAsciiAlpha(static_cast<unsigned char>(encoded[0])) && encoded[1] == ':';
  if (startsWithDriveLetter || encoded.empty() || encoded[0] != PATH_SEP) {
    output += PATH_SEP;
  }

  for (char c : encoded) {
    output += c == WINDOWS_PATH_SEP ? PATH_SEP : c;
  }

  return output;
}

} // namespace TesseraUtility
