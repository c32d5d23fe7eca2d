// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_CORE_TRACE_P_H_INCLUDED
#define TTKIT_CORE_TRACE_P_H_INCLUDED

#include <ttkit/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup tt_internal
//! \{

// TTDummyTrace
// ============

//! Dummy trace - no tracing, no runtime overhead.
class TTDummyTrace {
public:
  TT_INLINE bool enabled() const noexcept { return false; };
  TT_INLINE void indent() noexcept {}
  TT_INLINE void deindent() noexcept {}

  template<typename... Args>
  TT_INLINE void out(Args&&...) noexcept {}

  template<typename... Args>
  TT_INLINE void info(Args&&...) noexcept {}

  template<typename... Args>
  TT_INLINE bool warn(Args&&...) noexcept { return false; }

  template<typename... Args>
  TT_INLINE bool fail(Args&&...) noexcept { return false; }
};

// TTDebugTrace
// ============

//! Debug trace - active / enabled trace that can be useful during debugging.
class TTDebugTrace {
public:
  TT_INLINE TTDebugTrace() noexcept
    : indentation(0) {}
  TT_INLINE TTDebugTrace(const TTDebugTrace& other) noexcept
    : indentation(other.indentation) {}

  TT_INLINE bool enabled() const noexcept { return true; };
  TT_INLINE void indent() noexcept { indentation++; }
  TT_INLINE void deindent() noexcept { indentation--; }

  template<typename... Args>
  TT_INLINE void out(Args&&... args) noexcept { log(0, 0xFFFFFFFFu, std::forward<Args>(args)...); }

  template<typename... Args>
  TT_INLINE void info(Args&&... args) noexcept { log(0, indentation, std::forward<Args>(args)...); }

  template<typename... Args>
  TT_INLINE bool warn(Args&&... args) noexcept { log(1, indentation, std::forward<Args>(args)...); return false; }

  template<typename... Args>
  TT_INLINE bool fail(Args&&... args) noexcept { log(2, indentation, std::forward<Args>(args)...); return false; }

  TT_HIDDEN static void log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept;

  uint32_t indentation;
};

//! \}
//! \endcond

#endif // TTKIT_CORE_TRACE_P_H_INCLUDED
