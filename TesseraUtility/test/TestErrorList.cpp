#include <TesseraUtility/ErrorList.h>
#include <TesseraUtility/Result.h>

#include <doctest/doctest.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <string>
#include <vector>

using namespace TesseraUtility;

TEST_CASE("ErrorList") {
  ErrorList errorList;

  SUBCASE("initially has no errors or warnings") {
    CHECK(errorList.errors.empty());
    CHECK(errorList.warnings.empty());
    CHECK(!errorList.hasErrors());
    CHECK(!errorList);
  }

  SUBCASE("can emplace error") {
    errorList.emplaceError("An error occurred");
    REQUIRE(errorList.errors.size() == 1);
    CHECK(errorList.errors[0] == "An error occurred");
    CHECK(errorList.warnings.empty());
    CHECK(errorList.hasErrors());
  }

  SUBCASE("warnings alone are not errors") {
    errorList.emplaceWarning("A warning occurred");
    CHECK(errorList.warnings.size() == 1);
    CHECK(!errorList.hasErrors());
  }

  SUBCASE("formats as empty string when there are no errors or warnings") {
    CHECK(errorList.format("The prompt:") == "");
  }

  SUBCASE("formats errors before warnings") {
    errorList.emplaceWarning("First warning");
    errorList.emplaceError("First error");
    errorList.emplaceError("Second error");
    CHECK(
        errorList.format("The prompt:") ==
        "The prompt:\n- [Error] First error\n- [Error] Second error\n- "
        "[Warning] First warning");
  }

  SUBCASE("merges another list") {
    errorList.emplaceError("mine");
    ErrorList other = ErrorList::error("theirs");
    other.emplaceWarning("careful");

    SUBCASE("by copy") {
      errorList.merge(other);
      CHECK(other.errors.size() == 1);
    }

    SUBCASE("by move") { errorList.merge(std::move(other)); }

    CHECK(errorList.errors == std::vector<std::string>{"mine", "theirs"});
    CHECK(errorList.warnings == std::vector<std::string>{"careful"});
  }

  SUBCASE("logs at the most severe level") {
    auto pSink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(4);
    auto pLogger = std::make_shared<spdlog::logger>("test", pSink);

    errorList.emplaceWarning("Only a warning");
    errorList.log(pLogger, "Reading input:");

    std::vector<std::string> logged = pSink->last_formatted();
    REQUIRE(logged.size() == 1);
    CHECK(logged[0].find("[warning]") != std::string::npos);
    CHECK(logged[0].find("Only a warning") != std::string::npos);

    errorList.emplaceError("Now an error");
    errorList.log(pLogger, "Reading input:");
    logged = pSink->last_formatted();
    REQUIRE(logged.size() == 2);
    CHECK(logged[1].find("[error]") != std::string::npos);
  }
}

TEST_CASE("Result") {
  SUBCASE("holds a value without errors") {
    Result<int> result(42);
    REQUIRE(result.value);
    CHECK(*result.value == 42);
    CHECK(!result.errors);
  }

  SUBCASE("holds errors without a value") {
    Result<int> result(ErrorList::error("no value"));
    CHECK(!result.value);
    CHECK(result.errors.hasErrors());
  }
}
