#pragma once

#include <TesseraUtility/Library.h>

#include <spdlog/fwd.h>

#include <memory>
#include <string>
#include <vector>

namespace TesseraUtility {

/**
 * @brief Errors and warnings collected while reading an input, such as a
 * GeoJSON document or a provider configuration.
 *
 * Unlike a thrown {@link CodedError}, an ErrorList lets a reader report every
 * problem it found and still hand back a partial value alongside warnings.
 */
struct TESSERAUTILITY_API ErrorList {
  /**
   * @brief Creates an {@link ErrorList} containing a single error.
   */
  static ErrorList error(std::string errorMessage);

  /**
   * @brief Creates an {@link ErrorList} containing a single warning.
   */
  static ErrorList warning(std::string warningMessage);

  /**
   * @brief Appends the errors and warnings of another list to this one.
   */
  void merge(const ErrorList& errorList);

  /** @copydoc merge */
  void merge(ErrorList&& errorList);

  /**
   * @brief Adds an error message.
   */
  template <typename ErrorStr> void emplaceError(ErrorStr&& error) {
    errors.emplace_back(std::forward<ErrorStr>(error));
  }

  /**
   * @brief Adds a warning message.
   */
  template <typename WarningStr> void emplaceWarning(WarningStr&& warning) {
    warnings.emplace_back(std::forward<WarningStr>(warning));
  }

  /**
   * @brief Checks if there are any error messages.
   */
  bool hasErrors() const noexcept;

  /**
   * @brief Logs the list as a single message.
   *
   * The message is logged at error level if there is at least one error, at
   * warning level if there are only warnings, and not at all otherwise.
   *
   * @param pLogger The logger to receive the message.
   * @param prompt The first line of the message.
   */
  void log(const std::shared_ptr<spdlog::logger>& pLogger,
           const std::string& prompt) const noexcept;

  /**
   * @brief Formats all of the errors and warnings into a single string.
   *
   * Each entry is placed on its own line below the prompt, prefixed with
   * `- [Error]` or `- [Warning]`.
   *
   * @param prompt The first line of the message.
   * @returns The formatted message, or an empty string if there are no errors
   * or warnings.
   */
  std::string format(const std::string& prompt) const;

  /**
   * @brief Checks if there are any error messages.
   */
  explicit operator bool() const noexcept;

  /**
   * @brief The error messages of this container
   */
  std::vector<std::string> errors;

  /**
   * @brief The warning messages of this container
   */
  std::vector<std::string> warnings;
};

} // namespace TesseraUtility
