// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_CORE_FONTDEFS_H_INCLUDED
#define TTKIT_CORE_FONTDEFS_H_INCLUDED

#include <ttkit/core/api.h>

#include <functional>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

//! \addtogroup tt_text
//! \{

//! \name Font Related Constants
//! \{

//! Flags that can be passed to \ref TTFont::create_from_file() and \ref TTFont::create_from_data().
enum TTFontDecodeFlags : uint32_t {
  //! No flags.
  TT_FONT_DECODE_NO_FLAGS = 0u,
  //! Don't decode 'kern' table, even when the font provides one.
  TT_FONT_DECODE_SKIP_KERN = 0x00000001u,
  //! Decode only glyph headers (contour count and bounding box), don't decode contours.
  TT_FONT_DECODE_SKIP_OUTLINES = 0x00000002u,
  //! Fail with \ref TT_ERROR_UNSUPPORTED_FONT if the font has no usable character mapping.
  TT_FONT_DECODE_STRICT_CMAP = 0x00000004u,
  //! Verify checksums of all tables and report mismatches through \ref TT_FONT_DIAG_WRONG_TABLE_CHECKSUM.
  TT_FONT_DECODE_VERIFY_CHECKSUMS = 0x00000008u
};

//! Diagnostic flags offered by \ref TTFont.
//!
//! Each flag describes a problem that didn't prevent the font from being decoded.
enum TTFontDiagFlags : uint32_t {
  //! No flags.
  TT_FONT_DIAG_NO_FLAGS = 0u,
  //! Wrong data in 'kern' table [some or all kerning subtables dropped].
  TT_FONT_DIAG_WRONG_KERN_DATA = 0x00000001u,
  //! Unsupported format of 'kern' subtable [subtable skipped].
  TT_FONT_DIAG_WRONG_KERN_FORMAT = 0x00000002u,
  //! Wrong data in 'cmap' subtable [subtable skipped].
  TT_FONT_DIAG_WRONG_CMAP_DATA = 0x00000004u,
  //! Unsupported format of 'cmap' subtable [subtable skipped].
  TT_FONT_DIAG_WRONG_CMAP_FORMAT = 0x00000008u,
  //! No usable character mapping found.
  TT_FONT_DIAG_NO_CHARACTER_MAPPING = 0x00000010u,
  //! One or more tables have a wrong checksum.
  TT_FONT_DIAG_WRONG_TABLE_CHECKSUM = 0x00000020u,
  //! Suspicious data in 'head' table (magic number or units per em).
  TT_FONT_DIAG_WRONG_HEAD_DATA = 0x00000040u
};

TT_DEFINE_ENUM_FLAGS(TTFontDecodeFlags)
TT_DEFINE_ENUM_FLAGS(TTFontDiagFlags)

//! \}

//! \name Table Directory
//! \{

//! Global sfnt header (offset table).
struct TTTableDirectory {
  uint32_t sfnt_version;
  uint16_t num_tables;
  uint16_t search_range;
  uint16_t entry_selector;
  uint16_t range_shift;

  TT_INLINE_NODEBUG void reset() noexcept { *this = TTTableDirectory{}; }
};

//! Location of a single table as declared by the table directory.
struct TTTableRecord {
  //! Table tag, see \ref TT_MAKE_TAG.
  TTTag tag;
  //! Checksum as stored in the directory.
  uint32_t check_sum;
  //! Offset of the table relative to the beginning of the font data.
  uint32_t offset;
  //! Length of the table in bytes.
  uint32_t length;
};

//! \}

//! \name Scalar Tables
//! \{

//! Decoded 'head' table.
struct TTHeadTable {
  enum : uint32_t {
    kMagicNumber = 0x5F0F3CF5u
  };

  enum IndexToLocFormat : uint16_t {
    kIndexToLocUInt16 = 0,
    kIndexToLocUInt32 = 1
  };

  uint32_t version;
  uint32_t revision;
  uint32_t check_sum_adjustment;
  uint32_t magic_number;
  uint16_t flags;
  uint16_t units_per_em;
  int64_t created;
  int64_t modified;
  int16_t x_min;
  int16_t y_min;
  int16_t x_max;
  int16_t y_max;
  uint16_t mac_style;
  uint16_t lowest_rec_ppem;
  int16_t font_direction_hint;
  //! Loca entry format: 0 means 16-bit entries (half of the offset), 1 means 32-bit entries.
  uint16_t index_to_loc_format;
  uint16_t glyph_data_format;
};

//! Decoded 'maxp' table.
//!
//! Only `version` and `num_glyphs` are provided by all versions, the remaining fields are zero unless the table
//! is version 1.0 (TrueType outlines).
struct TTMaxPTable {
  uint32_t version;
  uint16_t num_glyphs;
  uint16_t max_points;
  uint16_t max_contours;
  uint16_t max_component_points;
  uint16_t max_component_contours;
  uint16_t max_component_depth;
};

//! \}

//! \name Kerning
//! \{

//! Kerning pair key - left and right glyph codes as stored by a format 0 subtable.
//!
//! The pair is order-sensitive, `{a, b}` and `{b, a}` are different keys.
struct TTKernPair {
  uint16_t left;
  uint16_t right;

  TT_INLINE_NODEBUG uint32_t combined() const noexcept { return (uint32_t(left) << 16) | uint32_t(right); }

  TT_INLINE_NODEBUG bool operator==(const TTKernPair& other) const noexcept { return combined() == other.combined(); }
  TT_INLINE_NODEBUG bool operator!=(const TTKernPair& other) const noexcept { return combined() != other.combined(); }
};

//! Decoded coverage field of a kerning subtable.
struct TTKernCoverage {
  enum Flags : uint8_t {
    kFlagHorizontal  = 0x01u,
    kFlagMinimum     = 0x02u,
    kFlagCrossStream = 0x04u,
    kFlagOverride    = 0x08u,
    kReservedBits    = 0xF0u
  };

  //! Raw 16-bit coverage value.
  uint16_t raw;
  //! Flags (bits 0-3 of the low byte), see \ref Flags.
  uint8_t flags;
  //! Reserved nibble (bits 4-7 of the low byte, kept in place).
  uint8_t reserved;
  //! Subtable format (high byte).
  uint8_t format;

  static TT_INLINE_NODEBUG TTKernCoverage from_raw(uint32_t raw) noexcept {
    TTKernCoverage coverage {};
    coverage.raw = uint16_t(raw);
    coverage.flags = uint8_t(raw & 0x0Fu);
    coverage.reserved = uint8_t(raw & kReservedBits);
    coverage.format = uint8_t((raw >> 8) & 0xFFu);
    return coverage;
  }

  TT_INLINE_NODEBUG bool is_horizontal() const noexcept { return (flags & kFlagHorizontal) != 0; }
  TT_INLINE_NODEBUG bool is_minimum() const noexcept { return (flags & kFlagMinimum) != 0; }
  TT_INLINE_NODEBUG bool is_cross_stream() const noexcept { return (flags & kFlagCrossStream) != 0; }
  TT_INLINE_NODEBUG bool is_override() const noexcept { return (flags & kFlagOverride) != 0; }
};

//! Hash of \ref TTKernPair.
struct TTKernPairHash {
  TT_INLINE_NODEBUG size_t operator()(const TTKernPair& pair) const noexcept { return std::hash<uint32_t>()(pair.combined()); }
};

//! Kerning adjustments of a single subtable.
typedef std::unordered_map<TTKernPair, int16_t, TTKernPairHash> TTKernPairMap;

//! Decoded format 0 kerning subtable.
struct TTKernSubtable {
  uint16_t version;
  uint16_t length;
  TTKernCoverage coverage;

  uint16_t n_pairs;
  uint16_t search_range;
  uint16_t entry_selector;
  uint16_t range_shift;

  //! Pair to signed adjustment mapping.
  TTKernPairMap pairs;
};

//! Decoded 'kern' table.
struct TTKernTable {
  uint16_t version;
  uint16_t n_tables;
  //! Successfully decoded subtables (unsupported ones are skipped).
  std::vector<TTKernSubtable> subtables;
};

//! \}

//! \name Character Mapping
//! \{

//! Encoding record of a 'cmap' table.
struct TTCMapEncodingRecord {
  uint16_t platform_id;
  uint16_t encoding_id;
  //! Subtable offset relative to the beginning of the 'cmap' table.
  uint32_t offset;
};

//! Decoded 'cmap' table.
struct TTCMapTable {
  uint16_t version;
  //! All encoding records, in table order.
  std::vector<TTCMapEncodingRecord> encodings;
  //! Formats of subtables that were decoded successfully.
  std::vector<uint16_t> decoded_formats;

  //! Glyph id to character code association - when more codes map to the same glyph the last decoded one wins.
  std::unordered_map<uint32_t, uint32_t> glyph_to_char;
  //! Character code to glyph id mapping.
  std::unordered_map<uint32_t, uint32_t> char_to_glyph;
};

//! \}

//! \name Glyph Outlines
//! \{

//! Glyph bounding box in font units.
struct TTGlyphBox {
  int16_t x_min;
  int16_t y_min;
  int16_t x_max;
  int16_t y_max;

  TT_INLINE_NODEBUG bool operator==(const TTGlyphBox& other) const noexcept {
    return x_min == other.x_min && y_min == other.y_min && x_max == other.x_max && y_max == other.y_max;
  }
};

//! A single outline vertex with absolute coordinates.
struct TTContourPoint {
  //! Raw flag byte the point was decoded with. Points produced by a repeated flag keep its repeat bit (0x08).
  uint8_t flag;
  //! Whether the point lies on the curve (bit 0 of `flag`), otherwise it's a quadratic control point.
  bool on_curve;
  int32_t x;
  int32_t y;

  TT_INLINE_NODEBUG bool operator==(const TTContourPoint& other) const noexcept {
    return flag == other.flag && on_curve == other.on_curve && x == other.x && y == other.y;
  }
};

//! Body of a simple glyph.
struct TTContourData {
  //! Index of the last point of each contour.
  std::vector<uint16_t> end_indices;
  uint16_t instruction_length;
  //! Hinting instructions (opaque).
  std::vector<uint8_t> instructions;
  //! Points in outline order.
  std::vector<TTContourPoint> points;
};

//! A decoded glyph.
struct TTGlyph {
  TTGlyphId id;
  //! Number of contours - positive for simple glyphs, -1 for composite glyphs, 0 for empty glyphs.
  int16_t n_contours;
  TTGlyphBox bbox;
  //! Contours of a simple glyph, not present for composite and empty glyphs or when outlines were skipped.
  std::optional<TTContourData> contours;

  TT_INLINE_NODEBUG bool is_simple() const noexcept { return n_contours > 0; }
  TT_INLINE_NODEBUG bool is_composite() const noexcept { return n_contours < 0; }
  TT_INLINE_NODEBUG bool has_contours() const noexcept { return contours.has_value(); }
  TT_INLINE_NODEBUG size_t point_count() const noexcept { return contours ? contours->points.size() : size_t(0); }
};

//! Decoded 'loca' table.
struct TTLocaTable {
  //! Format of loca entries (copy of `TTHeadTable::index_to_loc_format`).
  uint16_t format;
  //! Glyph offsets relative to the beginning of 'glyf' table, already multiplied by 2 in case of format 0.
  std::vector<uint32_t> offsets;
};

//! Decoded 'glyf' table.
struct TTGlyfTable {
  //! Glyph sequence having `num_glyphs + 1` entries, the last one is a header-only sentinel.
  std::vector<TTGlyph> glyphs;
};

//! \}

//! \name Table Map
//! \{

//! Decoded payload of a table - `std::monostate` is used by tables that ttkit doesn't decode.
typedef std::variant<
  std::monostate,
  TTHeadTable,
  TTMaxPTable,
  TTCMapTable,
  TTKernTable,
  TTLocaTable,
  TTGlyfTable
> TTTablePayload;

//! A table of a decoded font - its directory record and decoded payload.
struct TTFontTable {
  TTTableRecord record;
  TTTablePayload payload;

  TT_INLINE_NODEBUG bool is_decoded() const noexcept { return !std::holds_alternative<std::monostate>(payload); }

  template<typename T>
  TT_INLINE_NODEBUG const T* payload_as() const noexcept { return std::get_if<T>(&payload); }

  template<typename T>
  TT_INLINE_NODEBUG T* payload_as() noexcept { return std::get_if<T>(&payload); }
};

//! Tag to table mapping.
typedef std::unordered_map<TTTag, TTFontTable> TTFontTableMap;

//! \}

//! \}

#endif // TTKIT_CORE_FONTDEFS_H_INCLUDED
