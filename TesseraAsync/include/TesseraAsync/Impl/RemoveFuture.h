#pragma once

#include <async++.h>

namespace TesseraAsync {

template <class T> class Future;

namespace Impl {
//! @cond Doxygen_Suppress

// Maps Future<T> and async::task<T> to T, leaving every other type unchanged,
// so a continuation returning a Future flattens into a Future of its value.
template <typename T> struct RemoveFuture {
  typedef T type;
};
template <typename T> struct RemoveFuture<Future<T>> {
  typedef T type;
};
template <typename T> struct RemoveFuture<const Future<T>> {
  typedef T type;
};
template <typename T> struct RemoveFuture<async::task<T>> {
  typedef T type;
};
template <typename T> struct RemoveFuture<const async::task<T>> {
  typedef T type;
};

//! @endcond
} // namespace Impl
} // namespace TesseraAsync
