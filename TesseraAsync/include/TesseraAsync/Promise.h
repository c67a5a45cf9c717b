#pragma once

#include <TesseraAsync/Future.h>
#include <TesseraAsync/Impl/TaskScheduler.h>

#include <async++.h>

#include <exception>
#include <memory>
#include <utility>

namespace TesseraAsync {

/**
 * @brief A promise that can be resolved or rejected by an asynchronous task.
 *
 * @tparam T The type of the object that the promise will be resolved with.
 */
template <typename T> class Promise {
public:
  /**
   * @brief Resolves the promise with a value.
   */
  void resolve(T&& value) const { this->_pEvent->set(std::move(value)); }

  /**
   * @brief Resolves the promise with a copy of a value.
   */
  void resolve(const T& value) const { this->_pEvent->set(value); }

  /**
   * @brief Rejects the promise with an exception object.
   */
  template <typename TException> void reject(TException error) const {
    this->_pEvent->set_exception(std::make_exception_ptr(std::move(error)));
  }

  /**
   * @brief Rejects the promise with an exception captured with
   * `std::current_exception`.
   */
  void reject(const std::exception_ptr& error) const {
    this->_pEvent->set_exception(error);
  }

  /**
   * @brief Gets the Future that resolves or rejects when this Promise is
   * resolved or rejected. This method may only be called once.
   */
  Future<T> getFuture() const {
    return Future<T>(this->_pSchedulers, this->_pEvent->get_task());
  }

private:
  Promise(
      const std::shared_ptr<Impl::AsyncSystemSchedulers>& pSchedulers,
      const std::shared_ptr<async::event_task<T>>& pEvent) noexcept
      : _pSchedulers(pSchedulers), _pEvent(pEvent) {}

  std::shared_ptr<Impl::AsyncSystemSchedulers> _pSchedulers;
  std::shared_ptr<async::event_task<T>> _pEvent;

  friend class AsyncSystem;
};

/**
 * @brief Specialization for promises that resolve to no value.
 */
template <> class Promise<void> {
public:
  /**
   * @brief Resolves the promise.
   */
  void resolve() const { this->_pEvent->set(); }

  /**
   * @copydoc Promise::reject(TException) const
   */
  template <typename TException> void reject(TException error) const {
    this->_pEvent->set_exception(std::make_exception_ptr(std::move(error)));
  }

  /**
   * @copydoc Promise::reject(const std::exception_ptr&) const
   */
  void reject(const std::exception_ptr& error) const {
    this->_pEvent->set_exception(error);
  }

  /**
   * @copydoc Promise::getFuture
   */
  Future<void> getFuture() const {
    return Future<void>(this->_pSchedulers, this->_pEvent->get_task());
  }

private:
  Promise(
      const std::shared_ptr<Impl::AsyncSystemSchedulers>& pSchedulers,
      const std::shared_ptr<async::event_task<void>>& pEvent) noexcept
      : _pSchedulers(pSchedulers), _pEvent(pEvent) {}

  std::shared_ptr<Impl::AsyncSystemSchedulers> _pSchedulers;
  std::shared_ptr<async::event_task<void>> _pEvent;

  friend class AsyncSystem;
};

} // namespace TesseraAsync

