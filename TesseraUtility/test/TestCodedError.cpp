#include <TesseraUtility/CodedError.h>
#include <TesseraUtility/Hash.h>

#include <doctest/doctest.h>

#include <functional>
#include <stdexcept>
#include <string>

using namespace TesseraUtility;

TEST_CASE("CodedError") {
  SUBCASE("carries its code and message") {
    CodedError error(ErrorCode::TileBudgetExceeded, "too many tiles");
    CHECK(error.code() == ErrorCode::TileBudgetExceeded);
    CHECK(std::string(error.what()) == "too many tiles");
  }

  SUBCASE("can be caught as a runtime_error") {
    CHECK_THROWS_AS(
        throw CodedError(ErrorCode::ChannelMismatch, "mismatch"),
        std::runtime_error);
  }

  SUBCASE("codes keep their published values") {
    CHECK(static_cast<int32_t>(ErrorCode::TileBudgetExceeded) == 1001);
    CHECK(static_cast<int32_t>(ErrorCode::InvalidArgument) == 1003);
    CHECK(static_cast<int32_t>(ErrorCode::DegenerateTransform) == 1007);
  }

  SUBCASE("codes have names") {
    CHECK(errorCodeName(ErrorCode::InvalidGeometry) == "InvalidGeometry");
    CHECK(errorCodeName(ErrorCode::TileFetchFailure) == "TileFetchFailure");
  }
}

TEST_CASE("Hash::combine") {
  const size_t a = std::hash<std::string>{}("mapbox");
  const size_t b = std::hash<std::string>{}("esri");
  CHECK(Hash::combine(a, b) == Hash::combine(a, b));
  CHECK(Hash::combine(a, b) != Hash::combine(a, a));
}
