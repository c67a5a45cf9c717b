#pragma once

#include "ContinuationReturnType.h"
#include "RemoveFuture.h"

namespace TesseraAsync {

template <typename T> class Future;

namespace Impl {
//! @cond Doxygen_Suppress

template <typename Func, typename T> struct ContinuationFutureType {
  using type = Future<typename RemoveFuture<
      typename ContinuationReturnType<Func, T>::type>::type>;
};

template <typename Func, typename T>
using ContinuationFutureType_t = typename ContinuationFutureType<Func, T>::type;

//! @endcond
} // namespace Impl
} // namespace TesseraAsync
