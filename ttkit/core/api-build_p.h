// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each ttkit source file. This means that any
// macros we might need to define to build 'ttkit' can be defined here instead of passing them to the compiler
// through command line.

#ifndef TTKIT_CORE_API_BUILD_P_H_INCLUDED
#define TTKIT_CORE_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL

//! Export mode is on when `TT_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `TT_BUILD_EXPORT` to define a proper `TT_API` decorator that is used by all exported functions.
#define TT_BUILD_EXPORT

//! \endcond

// Build - Configuration
// =====================

// #define TT_TRACE_OT_ALL          // Trace OpenType decoders (all).
// #define TT_TRACE_OT_CORE         // Trace OpenType core     ('head', 'maxp', table directory).
// #define TT_TRACE_OT_CMAP         // Trace OpenType cmap     ('cmap').
// #define TT_TRACE_OT_KERN         // Trace OpenType kerning  ('kern').
// #define TT_TRACE_OT_GLYF         // Trace OpenType outlines ('glyf', 'loca').
//
// ttkit provides traces that can be enabled during development. Traces can help to understand how certain
// fonts are decoded and can be used to track bugs. `TTKIT_TRACE` CMake option defines `TT_TRACE_OT_ALL`.

// Build - Requirements
// ====================

//! \cond NEVER

// Turn off deprecation warnings when building 'ttkit' as we use `vsnprintf()` correctly.
#ifdef _MSC_VER
  #if !defined(_CRT_SECURE_NO_DEPRECATE)
    #define _CRT_SECURE_NO_DEPRECATE
  #endif
  #if !defined(_CRT_SECURE_NO_WARNINGS)
    #define _CRT_SECURE_NO_WARNINGS
  #endif
#endif

// The file reader works with 64-bit file sizes, however, this feature must be enabled before including any header.
#if !defined(_WIN32) && !defined(_LARGEFILE64_SOURCE)
  #define _LARGEFILE64_SOURCE 1

  // These OSes use 64-bit offsets by default.
  #if defined(__APPLE__    ) || \
      defined(__HAIKU__    ) || \
      defined(__bsdi__     ) || \
      defined(__DragonFly__) || \
      defined(__FreeBSD__  ) || \
      defined(__NetBSD__   ) || \
      defined(__OpenBSD__  )
    #define TT_FILE64_API(NAME) NAME
  #else
    #define TT_FILE64_API(NAME) NAME##64
  #endif
#endif

#if !defined(_WIN32) && !defined(TT_FILE64_API)
  #define TT_FILE64_API(NAME) NAME
#endif

//! \endcond

// Build - Compiler Diagnostics
// ============================

//! \cond NEVER

#if defined(__clang__)
  #pragma clang diagnostic warning "-Wattributes"
  #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
  #pragma GCC diagnostic warning "-Wattributes"
  #pragma GCC diagnostic ignored "-Wunused-function"
#elif defined(_MSC_VER)
  #pragma warning(disable: 4127) // Conditional expression is constant.
  #pragma warning(disable: 4251) // Struct needs to have dll-interface.
  #pragma warning(disable: 4505) // Unreferenced local function has been removed.
  #pragma warning(disable: 4800) // Forcing value to bool true or false.
#endif

//! \endcond

#include <ttkit/core/api-internal_p.h>

#endif // TTKIT_CORE_API_BUILD_P_H_INCLUDED
