/**
* @file expected.hpp
 * @brief `wbr_detail::expected` / `unexpected`: std::expected when the standard
 *        library ships it, TartanLlama's tl::expected otherwise.
 *
 * Loader results and other fallible calls spell the wbr_detail names only, so
 * switching standard library does not touch call sites.
 */
#pragma once

#include <type_traits>
#include <utility>
#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace wbr_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace wbr_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif

namespace wbr_detail {
    /// Wrap an error for return from a function yielding expected<T, E>.
    template<class E>
    unexpected<std::decay_t<E>> make_unexpected(E&& e) {
        return unexpected<std::decay_t<E>>(std::forward<E>(e));
    }
}
