#pragma once

#include <type_traits>

namespace TesseraAsync {
namespace Impl {
//! @cond Doxygen_Suppress

template <typename Func, typename T> struct ContinuationReturnType {
  using type = typename std::invoke_result<Func, T>::type;
};

template <typename Func> struct ContinuationReturnType<Func, void> {
  using type = typename std::invoke_result<Func>::type;
};

//! @endcond
} // namespace Impl
} // namespace TesseraAsync
