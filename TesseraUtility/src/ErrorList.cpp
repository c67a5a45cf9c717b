#include <TesseraUtility/ErrorList.h>
#include <TesseraUtility/joinToString.h>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>

namespace TesseraUtility {

/*static*/ ErrorList ErrorList::error(std::string errorMessage) {
  return ErrorList{{std::move(errorMessage)}, {}};
}

/*static*/ ErrorList ErrorList::warning(std::string warningMessage) {
  return ErrorList{{}, {std::move(warningMessage)}};
}

void ErrorList::merge(const ErrorList& errorList) {
  errors.insert(errors.end(), errorList.errors.begin(), errorList.errors.end());
  warnings.insert(
      warnings.end(),
      errorList.warnings.begin(),
      errorList.warnings.end());
}

void ErrorList::merge(ErrorList&& errorList) {
  errors.reserve(errors.size() + errorList.errors.size());
  for (auto& error : errorList.errors) {
    errors.emplace_back(std::move(error));
  }

  warnings.reserve(warnings.size() + errorList.warnings.size());
  for (auto& warning : errorList.warnings) {
    warnings.emplace_back(std::move(warning));
  }
}

bool ErrorList::hasErrors() const noexcept { return !errors.empty(); }

void ErrorList::log(
    const std::shared_ptr<spdlog::logger>& pLogger,
    const std::string& prompt) const noexcept {
  if (!pLogger) {
    return;
  }

  if (!this->errors.empty()) {
    SPDLOG_LOGGER_ERROR(pLogger, this->format(prompt));
  } else if (!this->warnings.empty()) {
    SPDLOG_LOGGER_WARN(pLogger, this->format(prompt));
  }
}

std::string ErrorList::format(const std::string& prompt) const {
  if (this->warnings.empty() && this->errors.empty()) {
    return std::string();
  }

  std::string result = prompt;

  if (!this->errors.empty()) {
    result += "\n- [Error] " + joinToString(this->errors, "\n- [Error] ");
  }

  if (!this->warnings.empty()) {
    result += "\n- [Warning] " + joinToString(this->warnings, "\n- [Warning] ");
  }

  return result;
}

ErrorList::operator bool() const noexcept { return hasErrors(); }

} // namespace TesseraUtility
