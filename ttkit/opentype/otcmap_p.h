// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_OPENTYPE_OTCMAP_P_H_INCLUDED
#define TTKIT_OPENTYPE_OTCMAP_P_H_INCLUDED

#include <ttkit/opentype/otdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tt_opentype_impl
//! \{

namespace tt::OpenType {

//! OpenType 'cmap' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/cmap
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6cmap.html
struct CMapTable {
  enum : uint32_t { kBaseSize = 4 };

  enum : uint16_t {
    kPlatformWindows   = 3
  };

  enum : uint16_t {
    kWindowsEncodingSymbol = 0,
    kWindowsEncodingUCS2   = 1,
    kWindowsEncodingUCS4   = 10
  };

  struct Encoding {
    enum : uint32_t { kBaseSize = 8 };

    UInt16 platform_id;
    UInt16 encoding_id;
    Offset32 offset;
  };

  struct Group {
    enum : uint32_t { kBaseSize = 12 };

    UInt32 first;
    UInt32 last;
    UInt32 glyph_id;
  };

  struct Format4 {
    enum : uint32_t { kBaseSize = 14 };

    UInt16 format;
    UInt16 length;
    UInt16 language;
    UInt16 num_segs_x2;
    UInt16 search_range;
    UInt16 entry_selector;
    UInt16 range_shift;
    /*
    UInt16 last_char_array[num_segs];
    UInt16 pad;
    UInt16 first_char_array[num_segs];
    Int16 id_delta_array[num_segs];
    UInt16 id_offset_array[num_segs];
    UInt16 glyph_id_array[];
    */

    static TT_INLINE constexpr uint32_t last_char_offset() noexcept { return kBaseSize; }
    static TT_INLINE constexpr uint32_t pad_offset(uint32_t num_segs) noexcept { return kBaseSize + num_segs * 2u; }
    static TT_INLINE constexpr uint32_t first_char_offset(uint32_t num_segs) noexcept { return kBaseSize + 2u + num_segs * 2u; }
    static TT_INLINE constexpr uint32_t id_delta_offset(uint32_t num_segs) noexcept { return kBaseSize + 2u + num_segs * 4u; }
    static TT_INLINE constexpr uint32_t id_offset_offset(uint32_t num_segs) noexcept { return kBaseSize + 2u + num_segs * 6u; }
    static TT_INLINE constexpr uint32_t glyph_id_offset(uint32_t num_segs) noexcept { return kBaseSize + 2u + num_segs * 8u; }
  };

  struct Format12 {
    enum : uint32_t { kBaseSize = 16 };

    UInt16 format;
    UInt16 reserved;
    UInt32 length;
    UInt32 language;
    UInt32 group_count;
    /*
    Group group_array[group_count];
    */

    TT_INLINE const Group* group_array() const noexcept { return reinterpret_cast<const Group*>(this + 1); }
  };

  UInt16 version;
  UInt16 count;
  /*
  Encoding encoding_array[count];
  */

  TT_INLINE const Encoding* encoding_array() const noexcept { return reinterpret_cast<const Encoding*>(this + 1); }
};

namespace CMapImpl {

//! Highest Unicode code point accepted by format 12 groups.
static constexpr uint32_t kMaxCodePoint = 0x10FFFFu;

//! Tests whether the encoding is one of the Windows Unicode encodings the character mapping is built from.
static TT_INLINE bool is_supported_encoding(uint32_t platform_id, uint32_t encoding_id) noexcept {
  return platform_id == CMapTable::kPlatformWindows && (encoding_id == CMapTable::kWindowsEncodingSymbol ||
                                                        encoding_id == CMapTable::kWindowsEncodingUCS2   ||
                                                        encoding_id == CMapTable::kWindowsEncodingUCS4   );
}

//! Decodes a format 4 (segment mapping) subtable and records all mappings into `out`.
//!
//! `sub_table` starts at the format field and spans the rest of 'cmap' table. Returns \ref TT_ERROR_MALFORMED_CMAP
//! if the reserved pad is not zero while the last segment doesn't end with 0xFFFF, nothing is recorded in that case.
TTResult decode_format4(RawTable sub_table, TTCMapTable& out) noexcept;

//! Decodes a format 12 (segmented coverage) subtable and records all mappings into `out`.
//!
//! All groups are validated before anything is recorded, an invalid group makes the whole subtable
//! \ref TT_ERROR_MALFORMED_CMAP.
TTResult decode_format12(RawTable sub_table, TTCMapTable& out) noexcept;

//! Decodes 'cmap' table.
TTResult init(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept;

} // {CMapImpl}

} // {tt::OpenType}

//! \}
//! \endcond

#endif // TTKIT_OPENTYPE_OTCMAP_P_H_INCLUDED
