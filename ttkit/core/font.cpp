// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/font.h>
#include <ttkit/opentype/otface_p.h>
#include <ttkit/opentype/otkern_p.h>
#include <ttkit/support/containerops_p.h>

using namespace tt;
using namespace tt::OpenType;

// TTFont - Globals
// ================

namespace {

struct TTFontEmptyData {
  TTFontData font_data;
  TTFontTableMap tables;
  std::vector<TTGlyph> glyphs;
};

static const TTFontEmptyData& empty_data() noexcept {
  static const TTFontEmptyData empty {};
  return empty;
}

static constexpr TTTag kHeadTag = TT_MAKE_TAG('h', 'e', 'a', 'd');
static constexpr TTTag kMaxPTag = TT_MAKE_TAG('m', 'a', 'x', 'p');
static constexpr TTTag kCMapTag = TT_MAKE_TAG('c', 'm', 'a', 'p');
static constexpr TTTag kKernTag = TT_MAKE_TAG('k', 'e', 'r', 'n');
static constexpr TTTag kLocaTag = TT_MAKE_TAG('l', 'o', 'c', 'a');
static constexpr TTTag kGlyfTag = TT_MAKE_TAG('g', 'l', 'y', 'f');

} // {anonymous}

// TTFont - Construction & Destruction
// ===================================

TTFont::TTFont() noexcept {}
TTFont::TTFont(const TTFont& other) noexcept = default;
TTFont::TTFont(TTFont&& other) noexcept = default;
TTFont::~TTFont() noexcept {}

TTFont& TTFont::operator=(const TTFont& other) noexcept = default;
TTFont& TTFont::operator=(TTFont&& other) noexcept = default;

// TTFont - Create
// ===============

TTResult TTFont::create_from_file(const char* file_name, TTFontDecodeFlags decode_flags) noexcept {
  TTFontData font_data;
  TT_PROPAGATE(font_data.create_from_file(file_name));
  return create_from_data(std::move(font_data), decode_flags);
}

TTResult TTFont::create_from_data(const void* data, size_t size, TTFontDecodeFlags decode_flags) noexcept {
  if (TT_UNLIKELY(!data && size))
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  std::vector<uint8_t> storage;
  TT_PROPAGATE(ContainerOps::resize(storage, size));
  if (size)
    memcpy(storage.data(), data, size);

  TTFontData font_data;
  TT_PROPAGATE(font_data.create_from_data(std::move(storage)));
  return create_from_data(std::move(font_data), decode_flags);
}

TTResult TTFont::create_from_data(TTFontData&& font_data, TTFontDecodeFlags decode_flags) noexcept {
  if (TT_UNLIKELY(font_data.is_empty()))
    return tt_make_error(TT_ERROR_NOT_INITIALIZED);

  std::shared_ptr<OTFontImpl> impl;
  try {
    impl = std::make_shared<OTFontImpl>();
  }
  catch (const std::bad_alloc&) {
    return tt_make_error(TT_ERROR_OUT_OF_MEMORY);
  }

  impl->font_data = std::move(font_data);
  TT_PROPAGATE(init_open_type_font(impl.get(), decode_flags));

  _impl = std::move(impl);
  return TT_SUCCESS;
}

void TTFont::reset() noexcept {
  _impl.reset();
}

// TTFont - Font Data & Tables
// ===========================

const TTFontData& TTFont::font_data() const noexcept {
  return _impl ? _impl->font_data : empty_data().font_data;
}

const TTTableDirectory& TTFont::directory() const noexcept {
  return font_data().directory();
}

const std::vector<TTTableRecord>& TTFont::table_records() const noexcept {
  return font_data().table_records();
}

const TTFontTableMap& TTFont::tables() const noexcept {
  return _impl ? _impl->tables : empty_data().tables;
}

const TTFontTable* TTFont::table(TTTag tag) const noexcept {
  const TTFontTableMap& map = tables();
  auto it = map.find(tag);
  return it != map.end() ? &it->second : nullptr;
}

const TTHeadTable* TTFont::head() const noexcept { return _impl ? _impl->payload<TTHeadTable>(kHeadTag) : nullptr; }
const TTMaxPTable* TTFont::maxp() const noexcept { return _impl ? _impl->payload<TTMaxPTable>(kMaxPTag) : nullptr; }
const TTCMapTable* TTFont::cmap() const noexcept { return _impl ? _impl->payload<TTCMapTable>(kCMapTag) : nullptr; }
const TTKernTable* TTFont::kern() const noexcept { return _impl ? _impl->payload<TTKernTable>(kKernTag) : nullptr; }
const TTLocaTable* TTFont::loca() const noexcept { return _impl ? _impl->payload<TTLocaTable>(kLocaTag) : nullptr; }

// TTFont - Glyphs
// ===============

uint32_t TTFont::num_glyphs() const noexcept {
  return _impl ? _impl->num_glyphs : 0u;
}

const std::vector<TTGlyph>& TTFont::glyphs() const noexcept {
  const TTGlyfTable* glyf = _impl ? _impl->payload<TTGlyfTable>(kGlyfTag) : nullptr;
  return glyf ? glyf->glyphs : empty_data().glyphs;
}

const TTGlyph* TTFont::glyph(TTGlyphId glyph_id) const noexcept {
  const std::vector<TTGlyph>& all = glyphs();
  return glyph_id < all.size() ? &all[glyph_id] : nullptr;
}

TTResult TTFont::glyph_offset(TTGlyphId glyph_id, uint32_t* offset_out) const noexcept {
  *offset_out = 0;

  const TTLocaTable* loca_table = loca();
  const TTFontTable* glyf_table = table(kGlyfTag);

  if (TT_UNLIKELY(!loca_table || !glyf_table))
    return tt_make_error(TT_ERROR_NOT_INITIALIZED);

  if (TT_UNLIKELY(glyph_id >= loca_table->offsets.size()))
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  *offset_out = glyf_table->record.offset + loca_table->offsets[glyph_id];
  return TT_SUCCESS;
}

// TTFont - Character Mapping
// ==========================

TTResult TTFont::glyph_for_char(uint32_t uc, TTGlyphId* glyph_id_out) const noexcept {
  *glyph_id_out = 0;

  const TTCMapTable* cmap_table = cmap();
  if (!cmap_table)
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  auto it = cmap_table->char_to_glyph.find(uc);
  if (it == cmap_table->char_to_glyph.end())
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  *glyph_id_out = it->second;
  return TT_SUCCESS;
}

TTResult TTFont::char_for_glyph(TTGlyphId glyph_id, uint32_t* uc_out) const noexcept {
  *uc_out = 0;

  const TTCMapTable* cmap_table = cmap();
  if (!cmap_table)
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  auto it = cmap_table->glyph_to_char.find(glyph_id);
  if (it == cmap_table->glyph_to_char.end())
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  *uc_out = it->second;
  return TT_SUCCESS;
}

// TTFont - Kerning
// ================

int32_t TTFont::kerning(TTGlyphId left, TTGlyphId right) const noexcept {
  const TTKernTable* kern_table = kern();
  return kern_table ? KernImpl::kerning(*kern_table, left, right) : 0;
}

// TTFont - Diagnostics
// ====================

TTFontDiagFlags TTFont::diag_flags() const noexcept {
  return _impl ? _impl->diag_flags : TT_FONT_DIAG_NO_FLAGS;
}

TTResult TTFont::cmap_status() const noexcept {
  return _impl ? _impl->cmap_status : tt_make_error(TT_ERROR_NOT_INITIALIZED);
}
