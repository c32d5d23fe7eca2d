// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_test_p.h>
#if defined(TT_TEST)

#include <ttkit/core/font.h>

#include <testing/commons/sfntbuilder.h>

#include <algorithm>

// TTFont - Tests
// ==============

namespace tt {
namespace Tests {

static constexpr TTTag kCMapTag = TT_MAKE_TAG('c', 'm', 'a', 'p');
static constexpr TTTag kGlyfTag = TT_MAKE_TAG('g', 'l', 'y', 'f');
static constexpr TTTag kHeadTag = TT_MAKE_TAG('h', 'e', 'a', 'd');
static constexpr TTTag kKernTag = TT_MAKE_TAG('k', 'e', 'r', 'n');
static constexpr TTTag kLocaTag = TT_MAKE_TAG('l', 'o', 'c', 'a');
static constexpr TTTag kMaxPTag = TT_MAKE_TAG('m', 'a', 'x', 'p');

// Three glyphs: a square (.notdef), an empty glyph (space) and a composite glyph mapped from 'A'.
static std::vector<SFNTBuilder::TableEntry> build_font_tables(uint16_t loca_format = 0) {
  SFNTBuilder::GlyfLoca gl = SFNTBuilder::build_glyf_loca({
    SFNTBuilder::build_simple_glyph({ SFNTBuilder::square_contour() }),
    {},
    SFNTBuilder::build_glyph_header(-1, 0, 0, 500, 700)
  }, loca_format);

  SFNTBuilder::HeadInfo head_info;
  head_info.index_to_loc_format = loca_format;

  std::vector<uint8_t> cmap = SFNTBuilder::build_cmap({
    { 1, 0, SFNTBuilder::build_cmap4({ {32, 32, -31, 0}, {0xFFFF, 0xFFFF, 1, 0} }) },
    { 3, 1, SFNTBuilder::build_cmap4({ {32, 32, -31, 0}, {65, 65, -63, 0}, {0xFFFF, 0xFFFF, 1, 0} }) }
  });

  std::vector<uint8_t> kern = SFNTBuilder::build_kern({
    SFNTBuilder::build_kern_sub_table(TTKernCoverage::kFlagHorizontal, { {1, 2, -40}, {2, 1, 15} })
  });

  return {
    { kCMapTag, cmap },
    { kGlyfTag, gl.glyf },
    { kHeadTag, SFNTBuilder::build_head(head_info) },
    { kKernTag, kern },
    { kLocaTag, gl.loca },
    { kMaxPTag, SFNTBuilder::build_maxp(3) }
  };
}

static std::vector<SFNTBuilder::TableEntry> without_table(std::vector<SFNTBuilder::TableEntry> tables, TTTag tag) {
  tables.erase(std::remove_if(tables.begin(), tables.end(), [&](const SFNTBuilder::TableEntry& e) { return e.tag == tag; }), tables.end());
  return tables;
}

static std::vector<SFNTBuilder::TableEntry> with_table(std::vector<SFNTBuilder::TableEntry> tables, TTTag tag, std::vector<uint8_t> data) {
  for (SFNTBuilder::TableEntry& e : tables)
    if (e.tag == tag)
      e.data = std::move(data);
  return tables;
}

static TTResult decode(TTFont& font, const std::vector<SFNTBuilder::TableEntry>& tables, TTFontDecodeFlags flags = TT_FONT_DECODE_NO_FLAGS) {
  std::vector<uint8_t> data = SFNTBuilder::build_font(tables);
  return font.create_from_data(data.data(), data.size(), flags);
}

TEST(core_font, minimal_font) {
  std::vector<uint8_t> data = SFNTBuilder::build_minimal_font();

  TTFont font;
  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  EXPECT_FALSE(font.is_empty());
  EXPECT_EQ(font.num_glyphs(), 1u);
  ASSERT_EQ(font.glyphs().size(), 2u);

  const TTGlyph* glyph = font.glyph(0);
  ASSERT_NE(glyph, nullptr);
  EXPECT_EQ(glyph->id, 0u);
  EXPECT_EQ(glyph->n_contours, 1);
  EXPECT_EQ(glyph->point_count(), 4u);

  const TTGlyph* sentinel = font.glyph(1);
  ASSERT_NE(sentinel, nullptr);
  EXPECT_EQ(sentinel->id, 1u);
  EXPECT_FALSE(sentinel->has_contours());

  TTGlyphId glyph_id = 0xFFFFu;
  EXPECT_SUCCESS(font.glyph_for_char('A', &glyph_id));
  EXPECT_EQ(glyph_id, 0u);

  EXPECT_SUCCESS(font.cmap_status());
  EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_NO_FLAGS);
  EXPECT_EQ(font.kern(), nullptr);
  EXPECT_EQ(font.kerning(0, 0), 0);
}

TEST(core_font, tables) {
  TTFont font;
  ASSERT_SUCCESS(decode(font, build_font_tables()));

  EXPECT_EQ(font.directory().num_tables, 6u);
  EXPECT_EQ(font.table_records().size(), 6u);
  EXPECT_EQ(font.tables().size(), 6u);

  const TTFontTable* head_table = font.table(kHeadTag);
  ASSERT_NE(head_table, nullptr);
  EXPECT_EQ(head_table->record.tag, kHeadTag);
  EXPECT_EQ(head_table->record.length, 54u);
  EXPECT_TRUE(std::holds_alternative<TTHeadTable>(head_table->payload));

  const TTHeadTable* head = font.head();
  ASSERT_NE(head, nullptr);
  EXPECT_EQ(head->magic_number, TTHeadTable::kMagicNumber);
  EXPECT_EQ(head->units_per_em, 1000u);
  EXPECT_EQ(head->index_to_loc_format, 0u);

  const TTMaxPTable* maxp = font.maxp();
  ASSERT_NE(maxp, nullptr);
  EXPECT_EQ(maxp->version, 0x00010000u);
  EXPECT_EQ(maxp->num_glyphs, 3u);
  EXPECT_EQ(maxp->max_points, 64u);

  EXPECT_EQ(font.table(TT_MAKE_TAG('n', 'a', 'm', 'e')), nullptr);
}

TEST(core_font, glyphs) {
  for (uint16_t loca_format = 0; loca_format <= 1; loca_format++) {
    TTFont font;
    ASSERT_SUCCESS(decode(font, build_font_tables(loca_format)));

    ASSERT_EQ(font.num_glyphs(), 3u);
    ASSERT_EQ(font.glyphs().size(), 4u);
    ASSERT_NE(font.loca(), nullptr);
    EXPECT_EQ(font.loca()->format, loca_format);
    EXPECT_EQ(font.loca()->offsets.size(), 4u);

    const std::vector<TTGlyph>& glyphs = font.glyphs();
    for (uint32_t i = 0; i < glyphs.size(); i++)
      EXPECT_EQ(glyphs[i].id, i);

    EXPECT_TRUE(glyphs[0].is_simple());
    EXPECT_EQ(glyphs[0].point_count(), 4u);

    EXPECT_EQ(glyphs[1].n_contours, 0);
    EXPECT_FALSE(glyphs[1].has_contours());

    EXPECT_TRUE(glyphs[2].is_composite());
    EXPECT_FALSE(glyphs[2].has_contours());
    EXPECT_EQ(glyphs[2].bbox, (TTGlyphBox{0, 0, 500, 700}));

    EXPECT_EQ(font.glyph(4), nullptr);
  }
}

TEST(core_font, glyph_offset) {
  TTFont font;
  ASSERT_SUCCESS(decode(font, build_font_tables()));

  const TTFontTable* glyf = font.table(kGlyfTag);
  ASSERT_NE(glyf, nullptr);

  uint32_t offset = 0;
  EXPECT_SUCCESS(font.glyph_offset(0, &offset));
  EXPECT_EQ(offset, glyf->record.offset);

  uint32_t offset1 = 0;
  uint32_t offset2 = 0;
  EXPECT_SUCCESS(font.glyph_offset(1, &offset1));
  EXPECT_SUCCESS(font.glyph_offset(2, &offset2));
  EXPECT_GT(offset1, offset);
  EXPECT_EQ(offset1, offset2);

  EXPECT_SUCCESS(font.glyph_offset(3, &offset));
  EXPECT_EQ(offset, glyf->record.offset + glyf->record.length);

  EXPECT_EQ(font.glyph_offset(4, &offset), TTResult(TT_ERROR_INVALID_VALUE));
}

TEST(core_font, character_mapping) {
  TTFont font;
  ASSERT_SUCCESS(decode(font, build_font_tables()));

  const TTCMapTable* cmap = font.cmap();
  ASSERT_NE(cmap, nullptr);

  // Both encodings are kept, only the Windows one is decoded.
  ASSERT_EQ(cmap->encodings.size(), 2u);
  EXPECT_EQ(cmap->encodings[0].platform_id, 1u);
  EXPECT_EQ(cmap->encodings[1].platform_id, 3u);
  EXPECT_EQ(cmap->decoded_formats, (std::vector<uint16_t>{ 4 }));

  TTGlyphId glyph_id = 0;
  EXPECT_SUCCESS(font.glyph_for_char(' ', &glyph_id));
  EXPECT_EQ(glyph_id, 1u);
  EXPECT_SUCCESS(font.glyph_for_char('A', &glyph_id));
  EXPECT_EQ(glyph_id, 2u);
  EXPECT_EQ(font.glyph_for_char('B', &glyph_id), TTResult(TT_ERROR_INVALID_VALUE));

  uint32_t uc = 0;
  EXPECT_SUCCESS(font.char_for_glyph(2, &uc));
  EXPECT_EQ(uc, uint32_t('A'));
  EXPECT_EQ(font.char_for_glyph(0xFFFFFFu, &uc), TTResult(TT_ERROR_INVALID_VALUE));
}

TEST(core_font, kerning) {
  TTFont font;
  ASSERT_SUCCESS(decode(font, build_font_tables()));

  ASSERT_NE(font.kern(), nullptr);
  EXPECT_EQ(font.kern()->subtables.size(), 1u);
  EXPECT_EQ(font.kerning(1, 2), -40);
  EXPECT_EQ(font.kerning(2, 1), 15);
  EXPECT_EQ(font.kerning(1, 1), 0);

  TTFont skipped;
  ASSERT_SUCCESS(decode(skipped, build_font_tables(), TT_FONT_DECODE_SKIP_KERN));
  EXPECT_EQ(skipped.kern(), nullptr);
  EXPECT_EQ(skipped.kerning(1, 2), 0);
  EXPECT_NE(skipped.table(kKernTag), nullptr);
}

TEST(core_font, kern_diagnostics) {
  {
    TTFont font;
    ASSERT_SUCCESS(decode(font, with_table(build_font_tables(), kKernTag, SFNTBuilder::build_kern({}, 1))));
    EXPECT_EQ(font.kern(), nullptr);
    EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_WRONG_KERN_DATA);
  }

  {
    std::vector<uint8_t> kern = SFNTBuilder::build_kern({
      SFNTBuilder::build_kern_sub_table(TTKernCoverage::kFlagHorizontal, {}, 2, 4),
      SFNTBuilder::build_kern_sub_table(TTKernCoverage::kFlagHorizontal, { {1, 2, -10} })
    });

    TTFont font;
    ASSERT_SUCCESS(decode(font, with_table(build_font_tables(), kKernTag, kern)));
    EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_WRONG_KERN_FORMAT);
    ASSERT_NE(font.kern(), nullptr);
    EXPECT_EQ(font.kern()->subtables.size(), 1u);
    EXPECT_EQ(font.kerning(1, 2), -10);
  }
}

TEST(core_font, missing_required_tables) {
  const TTTag required[] = { kHeadTag, kMaxPTag, kLocaTag, kGlyfTag };

  for (TTTag tag : required) {
    TTFont font;
    EXPECT_EQ(decode(font, without_table(build_font_tables(), tag)), TTResult(TT_ERROR_FONT_MISSING_IMPORTANT_TABLE));
    EXPECT_TRUE(font.is_empty());
  }
}

TEST(core_font, missing_cmap) {
  std::vector<SFNTBuilder::TableEntry> tables = without_table(build_font_tables(), kCMapTag);

  TTFont font;
  ASSERT_SUCCESS(decode(font, tables));
  EXPECT_EQ(font.cmap_status(), TTResult(TT_ERROR_UNSUPPORTED_FONT));
  EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_NO_CHARACTER_MAPPING);
  EXPECT_EQ(font.cmap(), nullptr);
  EXPECT_EQ(font.num_glyphs(), 3u);

  TTGlyphId glyph_id = 0;
  EXPECT_EQ(font.glyph_for_char('A', &glyph_id), TTResult(TT_ERROR_INVALID_VALUE));

  TTFont strict;
  EXPECT_EQ(decode(strict, tables, TT_FONT_DECODE_STRICT_CMAP), TTResult(TT_ERROR_UNSUPPORTED_FONT));
  EXPECT_TRUE(strict.is_empty());
}

TEST(core_font, unsupported_cmap_format) {
  SFNTBuilder::ByteWriter format6;
  format6.u16(6).u16(10).u16(0).u16(65).u16(0);

  std::vector<uint8_t> cmap = SFNTBuilder::build_cmap({ { 3, 1, format6.data } });

  TTFont font;
  ASSERT_SUCCESS(decode(font, with_table(build_font_tables(), kCMapTag, cmap)));
  EXPECT_EQ(font.cmap_status(), TTResult(TT_ERROR_UNSUPPORTED_FONT));
  EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_WRONG_CMAP_FORMAT | TT_FONT_DIAG_NO_CHARACTER_MAPPING);

  ASSERT_NE(font.cmap(), nullptr);
  EXPECT_EQ(font.cmap()->encodings.size(), 1u);
  EXPECT_TRUE(font.cmap()->decoded_formats.empty());
}

TEST(core_font, skip_outlines) {
  TTFont font;
  ASSERT_SUCCESS(decode(font, build_font_tables(), TT_FONT_DECODE_SKIP_OUTLINES));

  const TTGlyph* glyph = font.glyph(0);
  ASSERT_NE(glyph, nullptr);
  EXPECT_EQ(glyph->n_contours, 1);
  EXPECT_EQ(glyph->bbox, (TTGlyphBox{100, 100, 700, 700}));
  EXPECT_FALSE(glyph->has_contours());
}

TEST(core_font, head_diagnostics) {
  SFNTBuilder::HeadInfo head_info;
  head_info.magic_number = 0x12345678u;

  TTFont font;
  ASSERT_SUCCESS(decode(font, with_table(build_font_tables(), kHeadTag, SFNTBuilder::build_head(head_info))));
  EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_WRONG_HEAD_DATA);
}

TEST(core_font, checksums) {
  std::vector<uint8_t> data = SFNTBuilder::build_font(build_font_tables());

  {
    TTFont font;
    ASSERT_SUCCESS(font.create_from_data(data.data(), data.size(), TT_FONT_DECODE_VERIFY_CHECKSUMS));
    EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_NO_FLAGS);
  }

  TTFont reference;
  ASSERT_SUCCESS(reference.create_from_data(data.data(), data.size()));
  const TTFontTable* kern = reference.table(kKernTag);
  ASSERT_NE(kern, nullptr);

  // The kern table ends with a pair value, changing it keeps the font decodable.
  data[kern->record.offset + kern->record.length - 1u] ^= 0x01u;

  {
    TTFont font;
    ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));
    EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_NO_FLAGS);
  }

  {
    TTFont font;
    ASSERT_SUCCESS(font.create_from_data(data.data(), data.size(), TT_FONT_DECODE_VERIFY_CHECKSUMS));
    EXPECT_EQ(font.diag_flags(), TT_FONT_DIAG_WRONG_TABLE_CHECKSUM);
  }
}

TEST(core_font, copies_share_decoded_data) {
  TTFont a;
  ASSERT_SUCCESS(decode(a, build_font_tables()));

  TTFont b(a);
  EXPECT_EQ(&a.glyphs(), &b.glyphs());

  a.reset();
  EXPECT_TRUE(a.is_empty());
  EXPECT_EQ(b.num_glyphs(), 3u);
  EXPECT_EQ(b.glyphs().size(), 4u);
}

TEST(core_font, empty_font) {
  TTFont font;

  EXPECT_TRUE(font.is_empty());
  EXPECT_EQ(font.num_glyphs(), 0u);
  EXPECT_TRUE(font.glyphs().empty());
  EXPECT_TRUE(font.tables().empty());
  EXPECT_EQ(font.head(), nullptr);
  EXPECT_EQ(font.kerning(1, 2), 0);
  EXPECT_EQ(font.cmap_status(), TTResult(TT_ERROR_NOT_INITIALIZED));

  uint32_t offset = 0;
  EXPECT_EQ(font.glyph_offset(0, &offset), TTResult(TT_ERROR_NOT_INITIALIZED));
}

TEST(core_font, create_from_file) {
  std::vector<uint8_t> data = SFNTBuilder::build_font(build_font_tables());

  SFNTBuilder::TempFile file;
  ASSERT_TRUE(file.create(data));

  TTFont from_file;
  TTFont from_data;
  ASSERT_SUCCESS(from_file.create_from_file(file.path.c_str()));
  ASSERT_SUCCESS(from_data.create_from_data(data.data(), data.size()));

  EXPECT_EQ(from_file.font_data().size(), data.size());
  EXPECT_TRUE(from_file.font_data().owns_data());
  EXPECT_EQ(from_file.directory().num_tables, from_data.directory().num_tables);
  EXPECT_EQ(from_file.tables().size(), from_data.tables().size());
  EXPECT_EQ(from_file.diag_flags(), from_data.diag_flags());
  EXPECT_EQ(from_file.cmap_status(), from_data.cmap_status());

  ASSERT_EQ(from_file.num_glyphs(), from_data.num_glyphs());
  ASSERT_EQ(from_file.glyphs().size(), from_data.glyphs().size());
  for (size_t i = 0; i < from_file.glyphs().size(); i++) {
    const TTGlyph& a = from_file.glyphs()[i];
    const TTGlyph& b = from_data.glyphs()[i];
    EXPECT_EQ(a.n_contours, b.n_contours) << "Glyph #" << i;
    EXPECT_EQ(a.bbox, b.bbox) << "Glyph #" << i;
    EXPECT_EQ(a.has_contours(), b.has_contours()) << "Glyph #" << i;
    if (a.has_contours() && b.has_contours())
      EXPECT_EQ(a.contours->points, b.contours->points) << "Glyph #" << i;
  }

  ASSERT_NE(from_file.cmap(), nullptr);
  ASSERT_NE(from_data.cmap(), nullptr);
  EXPECT_EQ(from_file.cmap()->char_to_glyph, from_data.cmap()->char_to_glyph);
  EXPECT_EQ(from_file.kerning(1, 2), -40);
  EXPECT_EQ(from_file.kerning(2, 1), 15);
}

TEST(core_font, create_from_empty_file) {
  SFNTBuilder::TempFile file;
  ASSERT_TRUE(file.create({}));

  TTFont font;
  EXPECT_EQ(font.create_from_file(file.path.c_str()), TTResult(TT_ERROR_FILE_EMPTY));
  EXPECT_TRUE(font.is_empty());
}

TEST(core_font, invalid_input) {
  TTFont font;
  EXPECT_EQ(font.create_from_data(nullptr, 4), TTResult(TT_ERROR_INVALID_VALUE));
  EXPECT_EQ(font.create_from_data(TTFontData()), TTResult(TT_ERROR_NOT_INITIALIZED));
  EXPECT_EQ(font.create_from_file("/this/path/does/not/exist.ttf"), TTResult(TT_ERROR_NO_ENTRY));

  const uint8_t garbage[16] = { 'w', 'O', 'F', 'F' };
  EXPECT_EQ(font.create_from_data(garbage, sizeof(garbage)), TTResult(TT_ERROR_INVALID_SIGNATURE));
  EXPECT_TRUE(font.is_empty());
}

} // {Tests}
} // {tt}

#endif // TT_TEST
