// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_CORE_FONT_H_INCLUDED
#define TTKIT_CORE_FONT_H_INCLUDED

#include <ttkit/core/fontdata.h>
#include <ttkit/core/fontdefs.h>

#include <memory>

namespace tt::OpenType { struct OTFontImpl; }

//! \addtogroup tt_text
//! \{

//! Decoded TrueType/OpenType font.
//!
//! A font is created by \ref create_from_file() or \ref create_from_data(), which decode the whole font at once.
//! The decoded representation is immutable and shared by copies of the same font, so copying a font is cheap and
//! a decoded font can be read from multiple threads.
class TTFont {
public:
  //! \name Construction & Destruction
  //! \{

  TT_API TTFont() noexcept;
  TT_API TTFont(const TTFont& other) noexcept;
  TT_API TTFont(TTFont&& other) noexcept;
  TT_API ~TTFont() noexcept;

  TT_API TTFont& operator=(const TTFont& other) noexcept;
  TT_API TTFont& operator=(TTFont&& other) noexcept;

  //! \}

  //! \name Create Functionality
  //! \{

  //! Reads a font file specified by `file_name` and decodes it.
  //!
  //! The call blocks until the file is read, decoding starts after the whole file is in memory.
  TT_API TTResult create_from_file(const char* file_name, TTFontDecodeFlags decode_flags = TT_FONT_DECODE_NO_FLAGS) noexcept;

  //! Decodes a font from `data` of `size` bytes. The data is copied, so it doesn't have to outlive the font.
  TT_API TTResult create_from_data(const void* data, size_t size, TTFontDecodeFlags decode_flags = TT_FONT_DECODE_NO_FLAGS) noexcept;

  //! Decodes a font from an already validated `font_data`, which is moved into the font.
  TT_API TTResult create_from_data(TTFontData&& font_data, TTFontDecodeFlags decode_flags = TT_FONT_DECODE_NO_FLAGS) noexcept;

  //! Resets the font to a default constructed state.
  TT_API void reset() noexcept;

  //! Tests whether the font is empty (not decoded).
  TT_INLINE_NODEBUG bool is_empty() const noexcept { return !_impl; }

  //! \}

  //! \name Font Data & Tables
  //! \{

  //! Returns font data (raw bytes and table directory).
  TT_API const TTFontData& font_data() const noexcept;

  //! Returns the global sfnt header.
  TT_API const TTTableDirectory& directory() const noexcept;

  //! Returns all table records in directory order.
  TT_API const std::vector<TTTableRecord>& table_records() const noexcept;

  //! Returns tag to table mapping of all tables declared by the directory.
  TT_API const TTFontTableMap& tables() const noexcept;

  //! Returns a table of the given `tag` or null if the font doesn't have such table.
  TT_API const TTFontTable* table(TTTag tag) const noexcept;

  //! Returns decoded 'head' table (null if the font is empty).
  TT_API const TTHeadTable* head() const noexcept;
  //! Returns decoded 'maxp' table (null if the font is empty).
  TT_API const TTMaxPTable* maxp() const noexcept;
  //! Returns decoded 'cmap' table, null if the font has no 'cmap' table.
  TT_API const TTCMapTable* cmap() const noexcept;
  //! Returns decoded 'kern' table, null if the font has no usable 'kern' table or it was not decoded.
  TT_API const TTKernTable* kern() const noexcept;
  //! Returns decoded 'loca' table (null if the font is empty).
  TT_API const TTLocaTable* loca() const noexcept;

  //! \}

  //! \name Glyphs
  //! \{

  //! Returns the number of glyphs as specified by 'maxp' table.
  TT_API uint32_t num_glyphs() const noexcept;

  //! Returns all glyphs, there is `num_glyphs() + 1` of them (the last one is a sentinel).
  TT_API const std::vector<TTGlyph>& glyphs() const noexcept;

  //! Returns a glyph of the given `glyph_id` or null if it's out of range.
  TT_API const TTGlyph* glyph(TTGlyphId glyph_id) const noexcept;

  //! Stores an absolute byte offset of `glyph_id` (within the font data) to `offset_out`.
  TT_API TTResult glyph_offset(TTGlyphId glyph_id, uint32_t* offset_out) const noexcept;

  //! \}

  //! \name Character Mapping
  //! \{

  //! Maps a character code `uc` to a glyph, returns \ref TT_ERROR_INVALID_VALUE if the code is not mapped.
  TT_API TTResult glyph_for_char(uint32_t uc, TTGlyphId* glyph_id_out) const noexcept;

  //! Maps a glyph to a character code, returns \ref TT_ERROR_INVALID_VALUE if the glyph is not mapped.
  //!
  //! If more character codes map to the same glyph, the last decoded one is returned.
  TT_API TTResult char_for_glyph(TTGlyphId glyph_id, uint32_t* uc_out) const noexcept;

  //! \}

  //! \name Kerning
  //! \{

  //! Returns a kerning adjustment of `left` and `right` glyphs (0 if there is no kerning).
  TT_API int32_t kerning(TTGlyphId left, TTGlyphId right) const noexcept;

  //! \}

  //! \name Diagnostics
  //! \{

  //! Returns diagnostic flags collected during decoding.
  TT_API TTFontDiagFlags diag_flags() const noexcept;

  //! Returns \ref TT_SUCCESS if the font provides a usable character mapping, \ref TT_ERROR_UNSUPPORTED_FONT
  //! otherwise.
  TT_API TTResult cmap_status() const noexcept;

  //! \}

private:
  std::shared_ptr<const tt::OpenType::OTFontImpl> _impl;
};

//! \}

#endif // TTKIT_CORE_FONT_H_INCLUDED
