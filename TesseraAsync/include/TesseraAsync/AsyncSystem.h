#pragma once

#include <TesseraAsync/Future.h>
#include <TesseraAsync/Impl/ContinuationFutureType.h>
#include <TesseraAsync/Impl/TaskScheduler.h>
#include <TesseraAsync/Impl/unwrapFuture.h>
#include <TesseraAsync/Library.h>
#include <TesseraAsync/Promise.h>

#include <async++.h>

#include <exception>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace TesseraAsync {
class ITaskProcessor;

/**
 * @brief A system for managing asynchronous requests and tasks.
 *
 * Instances of this class may be safely and efficiently stored and passed
 * around by value. All copies share the same schedulers. The _last_ copy must
 * outlive every continuation scheduled through it.
 */
class TESSERAASYNC_API AsyncSystem final {
public:
  /**
   * @brief Constructs a new instance.
   *
   * @param pTaskProcessor The interface used to run tasks in background
   * threads.
   */
  AsyncSystem(const std::shared_ptr<ITaskProcessor>& pTaskProcessor) noexcept;

  /**
   * @brief Creates a new Future by immediately invoking a function and giving
   * it the opportunity to resolve or reject a {@link Promise}.
   *
   * If the callback `f` throws an exception, the `Future` is rejected with
   * that exception.
   *
   * @tparam T The type that the Future resolves to.
   * @tparam Func The type of the callback function.
   * @param f The callback function to invoke immediately to create the Future.
   * @return A Future that will resolve when the callback function resolves the
   * supplied Promise.
   */
  template <typename T, typename Func> Future<T> createFuture(Func&& f) const {
    std::shared_ptr<async::event_task<T>> pEvent =
        std::make_shared<async::event_task<T>>();

    Promise<T> promise(this->_pSchedulers, pEvent);

    try {
      f(promise);
    } catch (...) {
      promise.reject(std::current_exception());
    }

    return Future<T>(this->_pSchedulers, pEvent->get_task());
  }

  /**
   * @brief Create a Promise that can be used at a later time to resolve or
   * reject a Future.
   */
  template <typename T> Promise<T> createPromise() const {
    return Promise<T>(
        this->_pSchedulers,
        std::make_shared<async::event_task<T>>());
  }

  /**
   * @brief Runs a function in a worker thread, returning a Future that
   * resolves when the function completes.
   *
   * If the function itself returns a `Future`, the function will not be
   * considered complete until that returned `Future` also resolves. If this
   * method is called from a worker thread, the callback is invoked
   * immediately.
   *
   * @tparam Func The type of the function.
   * @param f The function.
   * @return A future that resolves after the supplied function completes.
   */
  template <typename Func>
  Impl::ContinuationFutureType_t<Func, void> runInWorkerThread(Func&& f) const {
    return Impl::ContinuationFutureType_t<Func, void>(
        this->_pSchedulers,
        async::spawn(
            this->_pSchedulers->workerThread.immediate,
            Impl::unwrapFuture<Func>(std::forward<Func>(f))));
  }

  /**
   * @brief The value type of the Future returned by {@link all}.
   */
  template <typename T>
  using AllValueType =
      std::conditional_t<std::is_void_v<T>, void, std::vector<T>>;

  /**
   * @brief Creates a Future that resolves when every Future in a vector
   * resolves, and rejects when any Future in the vector rejects.
   *
   * Values are delivered in the same order as the input Futures. If more than
   * one input rejects, the exception of the first rejected Future in vector
   * order is used.
   *
   * @tparam T The type that each Future resolves to.
   * @param futures The list of futures.
   */
  template <typename T>
  Future<AllValueType<T>> all(std::vector<Future<T>>&& futures) const {
    std::vector<async::task<T>> tasks;
    tasks.reserve(futures.size());

    for (auto it = futures.begin(); it != futures.end(); ++it) {
      tasks.emplace_back(std::move(it->_task));
    }

    futures.clear();

    async::task<AllValueType<T>> task =
        async::when_all(tasks.begin(), tasks.end())
            .then(
                async::inline_scheduler(),
                [](std::vector<async::task<T>>&& tasks) {
                  if constexpr (std::is_void_v<T>) {
                    for (auto it = tasks.begin(); it != tasks.end(); ++it) {
                      it->get();
                    }
                  } else {
                    std::vector<T> results;
                    results.reserve(tasks.size());

                    for (auto it = tasks.begin(); it != tasks.end(); ++it) {
                      results.emplace_back(std::move(it->get()));
                    }
                    return results;
                  }
                });
    return Future<AllValueType<T>>(this->_pSchedulers, std::move(task));
  }

  /**
   * @brief Creates a future that is already resolved.
   */
  template <typename T> Future<T> createResolvedFuture(T&& value) const {
    return Future<T>(
        this->_pSchedulers,
        async::make_task<T>(std::forward<T>(value)));
  }

  /**
   * @brief Creates a future that is already resolved and resolves to no value.
   */
  Future<void> createResolvedFuture() const {
    return Future<void>(this->_pSchedulers, async::make_task());
  }

  /**
   * @brief Returns true if this instance and the right-hand side share the
   * same schedulers.
   */
  bool operator==(const AsyncSystem& rhs) const noexcept;

private:
  std::shared_ptr<Impl::AsyncSystemSchedulers> _pSchedulers;

  template <typename T> friend class Future;
};
} // namespace TesseraAsync
