// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_OPENTYPE_OTGLYF_P_H_INCLUDED
#define TTKIT_OPENTYPE_OTGLYF_P_H_INCLUDED

#include <ttkit/opentype/otdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tt_opentype_impl
//! \{

namespace tt::OpenType {

//! OpenType 'loca' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/loca
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6loca.html
struct LocaTable {
  // Minimum size would be 2 records (4 bytes) if the font has only 1 glyph and uses 16-bit LOCA.
  enum : uint32_t { kBaseSize = 4 };

  /*
  union {
    UInt16 offset_array16[...];
    UInt32 offset_array32[...];
  };
  */
};

//! OpenType 'glyf' table.
//!
//! External Resources:
//!   - https://docs.microsoft.com/en-us/typography/opentype/spec/glyf
//!   - https://developer.apple.com/fonts/TrueType-Reference-Manual/RM06/Chap6glyf.html
struct GlyfTable {
  enum : uint32_t { kBaseSize = 10 };

  struct Simple {
    enum Flags : uint8_t {
      kOnCurvePoint             = 0x01u,
      kXIsByte                  = 0x02u,
      kYIsByte                  = 0x04u,
      kRepeatFlag               = 0x08u,
      kXIsSameOrXByteIsPositive = 0x10u,
      kYIsSameOrYByteIsPositive = 0x20u
    };

    /*
    UInt16 end_pts_of_contours[number_of_contours];
    UInt16 instruction_length;
    UInt8 instructions[instruction_length];
    UInt8 flags[...];
    UInt8/UInt16 x_coordinates[...];
    UInt8/UInt16 y_coordinates[...];
    */
  };

  struct GlyphData {
    enum : uint32_t { kBaseSize = 10 };

    Int16 number_of_contours;
    FWord x_min;
    FWord y_min;
    FWord x_max;
    FWord y_max;
  };
};

namespace GlyfImpl {

//! Reads `glyph_count + 1` offsets of `loca` table in the given `format` (\ref TTHeadTable::IndexToLocFormat).
//!
//! Offsets of 16-bit format are multiplied by 2, so `out.offsets` always contains byte offsets relative to 'glyf'.
TTResult read_loca(RawTable loca, uint32_t format, uint32_t glyph_count, TTLocaTable& out) noexcept;

//! Resolves a byte range `[start, end)` of `glyph_id` relative to the beginning of 'glyf' table.
//!
//! Fails with \ref TT_ERROR_OUT_OF_BOUNDS if `glyph_id` has no loca entry and with \ref TT_ERROR_INVALID_DATA if
//! the range is reversed.
TTResult resolve_glyph_range(const TTLocaTable& loca, uint32_t glyph_id, uint32_t& start, uint32_t& end) noexcept;

//! Decodes the body of a simple glyph, `glyph` starts at the glyph header.
TTResult decode_simple_glyph(RawTable glyph, uint32_t contour_count, TTContourData& out) noexcept;

//! Decodes a glyph described by `[start, end)` range of `glyf` table into `out`.
TTResult decode_glyph(RawTable glyf, uint32_t start, uint32_t end, bool skip_outlines, TTGlyph& out) noexcept;

//! Decodes 'loca' and 'glyf' tables.
TTResult init(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept;

} // {GlyfImpl}

} // {tt::OpenType}

//! \}
//! \endcond

#endif // TTKIT_OPENTYPE_OTGLYF_P_H_INCLUDED
