#pragma once

#include <TesseraAsync/Impl/CatchFunction.h>
#include <TesseraAsync/Impl/ContinuationFutureType.h>
#include <TesseraAsync/Impl/TaskScheduler.h>
#include <TesseraAsync/Impl/unwrapFuture.h>

#include <async++.h>

#include <memory>
#include <type_traits>
#include <utility>

namespace TesseraAsync {

class AsyncSystem;

/**
 * @brief A value that will be available in the future, as produced by
 * {@link AsyncSystem}.
 *
 * A Future is move-only. Attaching a continuation consumes it, so each Future
 * has at most one continuation.
 *
 * @tparam T The type of the value.
 */
template <typename T> class Future final {
public:
  /**
   * @brief Move constructor
   */
  Future(Future<T>&& rhs) noexcept
      : _pSchedulers(std::move(rhs._pSchedulers)),
        _task(std::move(rhs._task)) {}

  /**
   * @brief Move assignment operator.
   */
  Future<T>& operator=(Future<T>&& rhs) noexcept {
    this->_pSchedulers = std::move(rhs._pSchedulers);
    this->_task = std::move(rhs._task);
    return *this;
  }

  Future(const Future<T>& rhs) = delete;
  Future<T>& operator=(const Future<T>& rhs) = delete;

  /**
   * @brief Registers a continuation function to be invoked in a worker thread
   * when this Future resolves, and invalidates this Future.
   *
   * If the function itself returns a `Future`, the function will not be
   * considered complete until that returned `Future` also resolves.
   *
   * If this Future is resolved from a worker thread, the continuation runs
   * immediately in that thread rather than in a separate task.
   *
   * @tparam Func The type of the function.
   * @param f The function.
   * @return A future that resolves after the supplied function completes.
   */
  template <typename Func>
  Impl::ContinuationFutureType_t<Func, T> thenInWorkerThread(Func&& f) && {
    return Impl::ContinuationFutureType_t<Func, T>(
        this->_pSchedulers,
        this->_task.then(
            this->_pSchedulers->workerThread.immediate,
            Impl::unwrapFuture<Func, T>(std::forward<Func>(f))));
  }

  /**
   * @brief Registers a continuation function to be invoked immediately in
   * whichever thread causes the Future to be resolved, and invalidates this
   * Future.
   *
   * If the Future is already resolved, the supplied function will be called
   * immediately in the calling thread and this method will not return until
   * that function does.
   *
   * @tparam Func The type of the function.
   * @param f The function.
   * @return A future that resolves after the supplied function completes.
   */
  template <typename Func>
  Impl::ContinuationFutureType_t<Func, T> thenImmediately(Func&& f) && {
    return Impl::ContinuationFutureType_t<Func, T>(
        this->_pSchedulers,
        this->_task.then(
            async::inline_scheduler(),
            Impl::unwrapFuture<Func, T>(std::forward<Func>(f))));
  }

  /**
   * @brief Registers a continuation function to be invoked immediately, in
   * whichever thread rejects this Future, and invalidates this Future.
   *
   * The function receives the exception as a `std::exception&&`. Its return
   * value becomes the resolved value of the returned Future, so any `then`
   * continuations chained after this one see either the original value or
   * the value produced by the catch callback.
   *
   * @tparam Func The type of the function.
   * @param f The function.
   * @return A future that resolves after the supplied function completes.
   */
  template <typename Func> Future<T> catchImmediately(Func&& f) && {
    return Future<T>(
        this->_pSchedulers,
        this->_task.then(
            async::inline_scheduler(),
            Impl::CatchFunction<Func, T, InlineScheduler>{
                async::inline_scheduler(),
                std::forward<Func>(f)}));
  }

  /**
   * @brief Registers a continuation function to be invoked in a worker thread
   * when this Future rejects, and invalidates this Future.
   *
   * @copydetails catchImmediately
   */
  template <typename Func> Future<T> catchInWorkerThread(Func&& f) && {
    return Future<T>(
        this->_pSchedulers,
        this->_task.then(
            async::inline_scheduler(),
            Impl::CatchFunction<
                Func,
                T,
                Impl::ImmediateScheduler<Impl::TaskScheduler>>{
                this->_pSchedulers->workerThread.immediate,
                std::forward<Func>(f)}));
  }

  /**
   * @brief Waits for the future to resolve or reject and returns the result.
   *
   * @return The value if the future resolves successfully.
   * @throws The exception that rejected the future.
   */
  T wait() {
    if constexpr (std::is_void_v<T>) {
      this->_task.get();
    } else {
      return this->_task.get();
    }
  }

  /**
   * @brief Determines if this future is already resolved or rejected.
   *
   * If this method returns true, it is guaranteed that {@link wait} will not
   * block but will instead immediately return a value or throw an exception.
   */
  bool isReady() const { return this->_task.ready(); }

private:
  Future(
      const std::shared_ptr<Impl::AsyncSystemSchedulers>& pSchedulers,
      async::task<T>&& task) noexcept
      : _pSchedulers(pSchedulers), _task(std::move(task)) {}

  using InlineScheduler =
      std::remove_reference_t<decltype(async::inline_scheduler())>;

  std::shared_ptr<Impl::AsyncSystemSchedulers> _pSchedulers;
  async::task<T> _task;

  friend class AsyncSystem;

  template <typename R> friend struct Impl::ParameterizedTaskUnwrapper;

  friend struct Impl::TaskUnwrapper;

  template <typename R> friend class Future;

  template <typename R> friend class Promise;
};

} // namespace TesseraAsync
