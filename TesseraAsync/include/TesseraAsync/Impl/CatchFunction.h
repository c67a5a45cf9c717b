#pragma once

#include "unwrapFuture.h"

#include <async++.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace TesseraAsync {
namespace Impl {
//! @cond Doxygen_Suppress

// Passes a resolved value through untouched. On rejection, schedules the
// catch callback with the exception, so its return value becomes the
// resolved value of the continuation.
template <typename Func, typename T, typename Scheduler> struct CatchFunction {
  Scheduler& scheduler;
  Func f;

  async::task<T> operator()(async::task<T>&& t) {
    try {
      if constexpr (std::is_void_v<T>) {
        t.get();
        return async::make_task();
      } else {
        return async::make_task(t.get());
      }
    } catch (...) {
      auto ptrToException = [f = std::move(f)](std::exception_ptr&& e) mutable {
        try {
          std::rethrow_exception(e);
        } catch (std::exception& e) {
          return f(std::move(e));
        } catch (...) {
          return f(std::runtime_error("Unknown exception"));
        }
      };
      return async::make_task(std::current_exception())
          .then(
              scheduler,
              unwrapFuture<decltype(ptrToException), std::exception_ptr>(
                  std::move(ptrToException)));
    }
  }
};

//! @endcond
} // namespace Impl
} // namespace TesseraAsync
