// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_OPENTYPE_OTKERN_P_H_INCLUDED
#define TTKIT_OPENTYPE_OTKERN_P_H_INCLUDED

#include <ttkit/opentype/otdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tt_opentype_impl
//! \{

namespace tt::OpenType {

//! OpenType 'kern' table (Windows variant).
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/kern
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6kern.html
struct KernTable {
  enum : uint32_t { kBaseSize = 4 };

  struct WinTableHeader {
    UInt16 version;
    UInt16 table_count;
  };

  struct WinGroupHeader {
    enum : uint32_t { kBaseSize = 6 };

    UInt16 version;
    UInt16 length;
    //! Format in the high byte, coverage flags in the low byte.
    UInt16 coverage;
  };

  struct Format0 {
    enum : uint32_t { kBaseSize = 8 };

    UInt16 pair_count;
    UInt16 search_range;
    UInt16 entry_selector;
    UInt16 range_shift;
    /*
    Pair pair_array[pair_count];
    */
  };

  struct Pair {
    enum : uint32_t { kBaseSize = 6 };

    UInt16 left;
    UInt16 right;
    FWord value;
  };

  WinTableHeader header;
};

namespace KernImpl {

//! Decodes a single kerning subtable starting at `offset` of `kern` table into `out`.
//!
//! The subtable header must be within the table. Pairs of a format 0 subtable are read relative to the table, not
//! the subtable, so the pair array can be longer than the subtable's `length` as long as it fits the table. Returns
//! \ref TT_ERROR_UNSUPPORTED_KERN_FORMAT if the subtable is not format 0 (the header of `out` is still filled).
TTResult decode_sub_table(RawTable kern, uint32_t offset, TTKernSubtable& out) noexcept;

//! Returns a combined kerning value of `left` and `right` glyphs of all horizontal subtables.
int32_t kerning(const TTKernTable& table, uint32_t left, uint32_t right) noexcept;

//! Decodes 'kern' table, if present.
TTResult init(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept;

} // {KernImpl}

} // {tt::OpenType}

//! \}
//! \endcond

#endif // TTKIT_OPENTYPE_OTKERN_P_H_INCLUDED
