#include <TesseraUtility/CodedError.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace TesseraUtility {

std::string_view errorCodeName(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::TileBudgetExceeded:
    return "TileBudgetExceeded";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidGeometry:
    return "InvalidGeometry";
  case ErrorCode::TileFetchFailure:
    return "TileFetchFailure";
  case ErrorCode::ChannelMismatch:
    return "ChannelMismatch";
  case ErrorCode::DegenerateTransform:
    return "DegenerateTransform";
  }
  return "Unknown";
}

CodedError::CodedError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), _code(code) {}

} // namespace TesseraUtility
