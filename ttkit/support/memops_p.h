// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_SUPPORT_MEMOPS_P_H_INCLUDED
#define TTKIT_SUPPORT_MEMOPS_P_H_INCLUDED

#include <ttkit/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup tt_internal
//! \{

namespace tt {
namespace MemOps {
namespace {

//! \name Memory Read
//! \{

[[nodiscard]] static TT_INLINE_NODEBUG uint32_t readU8(const void* p) noexcept { return uint32_t(static_cast<const uint8_t*>(p)[0]); }
[[nodiscard]] static TT_INLINE_NODEBUG int32_t readI8(const void* p) noexcept { return int32_t(static_cast<const int8_t*>(p)[0]); }

[[nodiscard]] static TT_INLINE_NODEBUG uint32_t readU16uBE(const void* p) noexcept {
  uint32_t hi = readU8(static_cast<const uint8_t*>(p) + 0);
  uint32_t lo = readU8(static_cast<const uint8_t*>(p) + 1);
  return (hi << 8) | lo;
}

[[nodiscard]] static TT_INLINE_NODEBUG int32_t readI16uBE(const void* p) noexcept {
  int32_t hi = readI8(static_cast<const uint8_t*>(p) + 0);
  int32_t lo = int32_t(readU8(static_cast<const uint8_t*>(p) + 1));
  return int32_t(uint32_t(hi) << 8) | lo;
}

[[nodiscard]] static TT_INLINE_NODEBUG uint32_t readU32uBE(const void* p) noexcept {
  uint32_t hi = readU16uBE(static_cast<const uint8_t*>(p) + 0);
  uint32_t lo = readU16uBE(static_cast<const uint8_t*>(p) + 2);
  return (hi << 16) | lo;
}

//! \}

} // {anonymous}
} // {MemOps}
} // {tt}

//! \}
//! \endcond

#endif // TTKIT_SUPPORT_MEMOPS_P_H_INCLUDED
