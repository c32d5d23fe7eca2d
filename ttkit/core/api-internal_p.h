// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_CORE_API_INTERNAL_P_H_INCLUDED
#define TTKIT_CORE_API_INTERNAL_P_H_INCLUDED

#include <ttkit/core/api.h>

// C Headers
// =========

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

// C++ Headers
// ===========

#include <limits>
#include <type_traits>
#include <utility>

//! \cond INTERNAL
//! \addtogroup tt_internal
//! \{

// Internal Macros
// ===============

//! \def TT_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported. Expands to
//! a compiler-specific code that affects the visibility.
#if defined(__GNUC__) && !defined(__MINGW32__)
  #define TT_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define TT_HIDDEN
#endif

//! \def TT_NONCOPYABLE(...)
//!
//! Like TT_NONCONSTRUCTIBLE, but also deletes copy constructor and copy assignment operator.
#define TT_NONCOPYABLE(...)                                                   \
  __VA_ARGS__(const __VA_ARGS__& other) = delete;                             \
  __VA_ARGS__& operator=(const __VA_ARGS__& other) = delete;

#define TT_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

#define TT_PROPAGATE_(exp, cleanup)                                           \
  do {                                                                        \
    TTResult _result_to_propagate = (exp);                                    \
    if (TT_UNLIKELY(_result_to_propagate != TT_SUCCESS)) {                    \
      cleanup                                                                 \
      return _result_to_propagate;                                            \
    }                                                                         \
  } while (0)

#define TT_PROPAGATE(...) TT_PROPAGATE_(__VA_ARGS__, {})

// Internal Functions
// ==================

//! Used to silence warnings about unused arguments or variables.
template<typename... Args>
static TT_INLINE_NODEBUG void tt_unused(Args&&...) noexcept {}

template<typename T>
static TT_INLINE constexpr T tt_min(const T& a, const T& b) noexcept { return b < a ? b : a; }

template<typename T>
static TT_INLINE constexpr T tt_max(const T& a, const T& b) noexcept { return a < b ? b : a; }

template<typename T>
static TT_INLINE constexpr bool tt_test_flag(const T& x, const T& y) noexcept {
  return (std::underlying_type_t<T>(x) & std::underlying_type_t<T>(y)) != std::underlying_type_t<T>(0);
}

//! \}
//! \endcond

#endif // TTKIT_CORE_API_INTERNAL_P_H_INCLUDED
