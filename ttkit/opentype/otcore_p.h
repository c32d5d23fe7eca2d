// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_OPENTYPE_OTCORE_P_H_INCLUDED
#define TTKIT_OPENTYPE_OTCORE_P_H_INCLUDED

#include <ttkit/opentype/otdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tt_opentype_impl
//! \{

namespace tt::OpenType {

//! OpenType 'SFNT' header.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/font-file
struct SFNTHeader {
  enum : uint32_t { kBaseSize = 12 };

  enum VersionTag : uint32_t {
    kVersionTagOpenType  = TT_MAKE_TAG('O', 'T', 'T', 'O'),
    kVersionTagTrueTypeA = TT_MAKE_TAG( 0,   1 ,  0 ,  0 ),
    kVersionTagTrueTypeB = TT_MAKE_TAG('t', 'r', 'u', 'e'),
    kVersionTagType1     = TT_MAKE_TAG('t', 'y', 'p', '1')
  };

  struct TableRecord {
    enum : uint32_t { kBaseSize = 16 };

    UInt32 tag;
    CheckSum check_sum;
    UInt32 offset;
    UInt32 length;
  };

  UInt32 version_tag;
  UInt16 num_tables;
  UInt16 search_range;
  UInt16 entry_selector;
  UInt16 range_shift;

  TT_INLINE const TableRecord* table_records() const noexcept { return reinterpret_cast<const TableRecord*>(this + 1); }

  static TT_INLINE_NODEBUG bool is_supported_version_tag(uint32_t tag) noexcept {
    return tag == kVersionTagOpenType  ||
           tag == kVersionTagTrueTypeA ||
           tag == kVersionTagTrueTypeB ||
           tag == kVersionTagType1;
  }
};

//! OpenType 'head' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/head
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6head.html
struct HeadTable {
  enum : uint32_t { kBaseSize = 54 };

  enum : uint32_t {
    kCheckSumAdjustment      = TT_MAKE_TAG(0xB1, 0xB0, 0xAF, 0xBA),
    kMagicNumber             = TT_MAKE_TAG(0x5F, 0x0F, 0x3C, 0xF5)
  };

  //! Offset of `check_sum_adjustment` field, which must be treated as zero when calculating table checksum.
  static constexpr uint32_t kCheckSumAdjustmentOffset = 8;

  enum IndexToLocFormat : uint16_t {
    kIndexToLocUInt16        = 0,
    kIndexToLocUInt32        = 1
  };

  F16x16 version;
  F16x16 revision;

  UInt32 check_sum_adjustment;
  UInt32 magic_number;
  UInt16 flags;
  UInt16 units_per_em;

  DateTime created;
  DateTime modified;

  Int16 x_min;
  Int16 y_min;
  Int16 x_max;
  Int16 y_max;

  UInt16 mac_style;
  UInt16 lowest_rec_ppem;

  Int16 font_direction_hint;
  UInt16 index_to_loc_format;
  UInt16 glyph_data_format;
};

//! OpenType 'maxp' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/maxp
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6maxp.html
struct MaxPTable {
  enum : uint32_t { kBaseSize = 6 };

  // V0.5 - Must be used with CFF Glyphs (OpenType).
  struct V0_5 {
    F16x16 version;
    UInt16 glyph_count;
  };

  // V1.0 - Must be used with TT Glyphs (TrueType).
  struct V1_0 : public V0_5 {
    enum : uint32_t { kBaseSize = 32 };

    UInt16 max_points;
    UInt16 max_contours;
    UInt16 max_component_points;
    UInt16 max_component_contours;
    UInt16 max_zones;
    UInt16 max_twilight_points;
    UInt16 max_storage;
    UInt16 max_function_defs;
    UInt16 max_instruction_defs;
    UInt16 max_stack_elements;
    UInt16 max_size_of_instructions;
    UInt16 max_component_elements;
    UInt16 max_component_depth;
  };

  V0_5 header;

  TT_INLINE const V0_5* v0_5() const noexcept { return reinterpret_cast<const V0_5*>(this); }
  TT_INLINE const V1_0* v1_0() const noexcept { return reinterpret_cast<const V1_0*>(this); }
};

namespace CoreImpl {

//! Decodes 'head' and 'maxp' tables.
TTResult init(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept;

} // {CoreImpl}

} // {tt::OpenType}

//! \}
//! \endcond

#endif // TTKIT_OPENTYPE_OTCORE_P_H_INCLUDED
