#pragma once

#include "ContinuationFutureType.h"
#include "ContinuationReturnType.h"

#include <type_traits>
#include <utility>

namespace TesseraAsync {
namespace Impl {
//! @cond Doxygen_Suppress

// async++ flattens continuations that return an async::task, but knows nothing
// about Future. These wrappers turn a continuation returning Future<R> into
// one returning the underlying async::task<R>.

struct IdentityUnwrapper {
  template <typename Func> static Func unwrap(Func&& f) {
    return std::forward<Func>(f);
  }
};

template <typename T> struct ParameterizedTaskUnwrapper {
  template <typename Func> static auto unwrap(Func&& f) {
    return [f = std::forward<Func>(f)](T&& t) mutable {
      return f(std::move(t))._task;
    };
  }
};

struct TaskUnwrapper {
  template <typename Func> static auto unwrap(Func&& f) {
    return [f = std::forward<Func>(f)]() mutable { return f()._task; };
  }
};

template <typename Func, typename T> auto unwrapFuture(Func&& f) {
  return std::conditional_t<
      std::is_same_v<
          typename ContinuationReturnType<Func, T>::type,
          typename RemoveFuture<
              typename ContinuationFutureType<Func, T>::type>::type>,
      IdentityUnwrapper,
      ParameterizedTaskUnwrapper<T>>::unwrap(std::forward<Func>(f));
}

template <typename Func> auto unwrapFuture(Func&& f) {
  return std::conditional_t<
      std::is_same_v<
          typename ContinuationReturnType<Func, void>::type,
          typename RemoveFuture<
              typename ContinuationFutureType<Func, void>::type>::type>,
      IdentityUnwrapper,
      TaskUnwrapper>::unwrap(std::forward<Func>(f));
}

//! @endcond
} // namespace Impl
} // namespace TesseraAsync
