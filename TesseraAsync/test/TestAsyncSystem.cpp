#include <TesseraAsync/AsyncSystem.h>
#include <TesseraAsync/HttpHeaders.h>
#include <TesseraAsync/IAssetAccessor.h>
#include <TesseraAsync/ITaskProcessor.h>
#include <TesseraAsync/Promise.h>
#include <TesseraUtility/CodedError.h>

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace TesseraAsync;
using namespace TesseraUtility;

namespace {

class MockTaskProcessor : public ITaskProcessor {
public:
  std::atomic<int32_t> tasksStarted = 0;

  void startTask(std::function<void()> f) override {
    ++tasksStarted;
    std::thread(f).detach();
  }
};

} // namespace

TEST_CASE("AsyncSystem") {
  std::shared_ptr<MockTaskProcessor> pTaskProcessor =
      std::make_shared<MockTaskProcessor>();
  AsyncSystem asyncSystem(pTaskProcessor);

  SUBCASE("runs worker tasks with the task processor") {
    bool executed = false;

    asyncSystem.runInWorkerThread([&executed]() { executed = true; }).wait();

    CHECK(pTaskProcessor->tasksStarted == 1);
    CHECK(executed);
  }

  SUBCASE("worker continuations following a worker run immediately") {
    int32_t startedInContinuation = -1;

    asyncSystem.runInWorkerThread([]() { return 1; })
        .thenInWorkerThread([&startedInContinuation, pTaskProcessor](int) {
          startedInContinuation = pTaskProcessor->tasksStarted;
        })
        .wait();

    CHECK(startedInContinuation == 1);
  }

  SUBCASE("can pass move-only objects between continuations") {
    auto future =
        asyncSystem
            .runInWorkerThread([]() { return std::make_unique<int>(42); })
            .thenInWorkerThread(
                [](std::unique_ptr<int>&& pResult) { return *pResult; });
    CHECK(future.wait() == 42);
  }

  SUBCASE("a continuation returning a future is unwrapped") {
    auto future = asyncSystem.runInWorkerThread(
        [asyncSystem]() { return asyncSystem.createResolvedFuture(7); });
    CHECK(future.wait() == 7);
  }

  SUBCASE("an exception thrown in a continuation rejects the future") {
    auto future = asyncSystem.runInWorkerThread(
        []() { throw std::runtime_error("test"); });
    CHECK_THROWS_WITH(future.wait(), "test");
  }

  SUBCASE("a coded error keeps its code through a rejected future") {
    auto future = asyncSystem.runInWorkerThread([]() -> int {
      throw CodedError(ErrorCode::TileFetchFailure, "tile missing");
    });

    bool caught = false;
    try {
      future.wait();
    } catch (const CodedError& e) {
      caught = true;
      CHECK(e.code() == ErrorCode::TileFetchFailure);
      CHECK(std::string(e.what()) == "tile missing");
    }
    CHECK(caught);
  }

  SUBCASE("an exception thrown in createFuture rejects the future") {
    auto future = asyncSystem.createFuture<int>(
        [](const auto& /*promise*/) { throw std::runtime_error("test"); });
    CHECK_THROWS_WITH(future.wait(), "test");
  }

  SUBCASE("createFuture promise may resolve later") {
    auto future = asyncSystem.createFuture<int>([](const auto& promise) {
      std::thread([promise]() {
        using namespace std::chrono_literals;
        std::this_thread::sleep_for(10ms);
        promise.resolve(42);
      }).detach();
    });
    CHECK(future.wait() == 42);
  }

  SUBCASE("rejected promise invokes catch instead of then") {
    auto future = asyncSystem
                      .createFuture<int>([](const auto& promise) {
                        promise.reject(std::runtime_error("test"));
                      })
                      .thenImmediately([](int /*x*/) {
                        CHECK(false);
                        return 1;
                      })
                      .catchImmediately([](std::exception&& e) {
                        CHECK(std::string(e.what()) == "test");
                        return 2;
                      });

    CHECK(future.wait() == 2);
  }

  SUBCASE("then after throwing catch is not invoked") {
    auto future = asyncSystem
                      .createFuture<int>([](const auto& promise) {
                        promise.reject(std::runtime_error("test"));
                      })
                      .catchInWorkerThread([](std::exception&& e) -> int {
                        CHECK(std::string(e.what()) == "test");
                        throw std::runtime_error("second");
                      })
                      .thenImmediately([](int /*x*/) {
                        CHECK(false);
                        return 3;
                      });

    CHECK_THROWS_WITH(future.wait(), "second");
  }

  SUBCASE("Future returned by all resolves in input order") {
    auto one = asyncSystem.createPromise<int>();
    auto two = asyncSystem.createPromise<int>();
    auto three = asyncSystem.createPromise<int>();

    std::vector<Future<int>> futures;
    futures.emplace_back(one.getFuture());
    futures.emplace_back(two.getFuture());
    futures.emplace_back(three.getFuture());

    auto all = asyncSystem.all(std::move(futures));

    three.resolve(3);
    one.resolve(1);
    two.resolve(2);

    std::vector<int> result = all.wait();
    REQUIRE(result.size() == 3);
    CHECK(result[0] == 1);
    CHECK(result[1] == 2);
    CHECK(result[2] == 3);
  }

  SUBCASE("Can use `all` with void-returning Futures") {
    auto one = asyncSystem.createPromise<void>();
    auto two = asyncSystem.createPromise<void>();

    std::vector<Future<void>> futures;
    futures.emplace_back(one.getFuture());
    futures.emplace_back(two.getFuture());

    Future<void> all = asyncSystem.all(std::move(futures));
    CHECK(!all.isReady());

    two.resolve();
    one.resolve();

    all.wait();
    CHECK(all.isReady());
  }

  SUBCASE("When multiple futures in an 'all' reject, the first in the list "
          "is used") {
    auto one = asyncSystem.createPromise<int>();
    auto two = asyncSystem.createPromise<int>();
    auto three = asyncSystem.createPromise<int>();

    std::vector<Future<int>> futures;
    futures.emplace_back(one.getFuture());
    futures.emplace_back(two.getFuture());
    futures.emplace_back(three.getFuture());

    auto all = asyncSystem.all(std::move(futures));

    three.reject(std::runtime_error("3"));
    one.resolve(1);
    two.reject(std::runtime_error("2"));

    CHECK_THROWS_WITH(all.wait(), "2");
  }

  SUBCASE("copies compare equal") {
    AsyncSystem copy = asyncSystem;
    AsyncSystem other(pTaskProcessor);
    CHECK(copy == asyncSystem);
    CHECK(!(other == asyncSystem));
  }
}

TEST_CASE("HttpHeaders") {
  HttpHeaders headers;
  headers["Content-Type"] = "image/png";
  CHECK(headers.find("content-type") != headers.end());
  CHECK(headers["CONTENT-TYPE"] == "image/png");
  CHECK(headers.size() == 1);
}

TEST_CASE("IAssetAccessor::mergeHeaders") {
  std::vector<IAssetAccessor::THeader> base{
      {"Authorization", "Bearer a"},
      {"Accept", "image/png"}};
  std::vector<IAssetAccessor::THeader> overrides{{"Authorization", "Bearer b"}};

  std::vector<IAssetAccessor::THeader> merged =
      IAssetAccessor::mergeHeaders(base, overrides);
  REQUIRE(merged.size() == 2);
  CHECK(merged[0].first == "Accept");
  CHECK(merged[1].second == "Bearer b");
}
