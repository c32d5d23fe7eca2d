// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_test_p.h>
#if defined(TT_TEST)

#include <ttkit/opentype/otglyf_p.h>

#include <testing/commons/sfntbuilder.h>

// tt::OpenType::GlyfImpl - Tests
// ==============================

namespace tt::OpenType {
namespace Tests {

static RawTable raw_table_of(const std::vector<uint8_t>& data) noexcept {
  return RawTable(data.data(), uint32_t(data.size()));
}

TEST(opentype_glyf, repeat_flag_expands_points) {
  // 1 contour, end index 3, no instructions, flag 0x31 (on-curve, x-same, y-same) repeated 3 times.
  SFNTBuilder::ByteWriter w;
  w.i16(1).i16(0).i16(0).i16(0).i16(0);
  w.u16(3).u16(0);
  w.u8(0x31u | 0x08u).u8(3);

  TTContourData contours {};
  ASSERT_SUCCESS(GlyfImpl::decode_simple_glyph(raw_table_of(w.data), 1, contours));

  ASSERT_EQ(contours.points.size(), 4u);
  for (const TTContourPoint& point : contours.points) {
    EXPECT_EQ(point.flag, 0x39u);
    EXPECT_TRUE(point.on_curve);
    EXPECT_EQ(point.x, 0);
    EXPECT_EQ(point.y, 0);
  }
}

TEST(opentype_glyf, repeat_flag_overshoot) {
  SFNTBuilder::ByteWriter w;
  w.i16(1).i16(0).i16(0).i16(0).i16(0);
  w.u16(2).u16(0);
  w.u8(0x31u | 0x08u).u8(5);

  TTContourData contours {};
  EXPECT_EQ(GlyfImpl::decode_simple_glyph(raw_table_of(w.data), 1, contours), TTResult(TT_ERROR_INVALID_DATA));
}

TEST(opentype_glyf, end_indices_must_not_decrease) {
  SFNTBuilder::ByteWriter w;
  w.i16(2).i16(0).i16(0).i16(0).i16(0);
  w.u16(5).u16(2).u16(0);
  for (uint32_t i = 0; i < 6; i++)
    w.u8(0x31u);

  TTContourData contours {};
  EXPECT_EQ(GlyfImpl::decode_simple_glyph(raw_table_of(w.data), 2, contours), TTResult(TT_ERROR_INVALID_DATA));
}

TEST(opentype_glyf, coordinates_are_accumulated) {
  // Mixes zero, 8-bit (positive and negative) and 16-bit deltas.
  SFNTBuilder::Contour contour {
    {   10,   20, true  },
    {   10,  300, false },
    { -500,  300, true  },
    { -245, -700, false },
    { 1000,   19, true  }
  };

  std::vector<uint8_t> glyph = SFNTBuilder::build_simple_glyph({ contour }, { 0xB0, 0x01 });

  TTGlyph out {};
  ASSERT_SUCCESS(GlyfImpl::decode_glyph(raw_table_of(glyph), 0, uint32_t(glyph.size()), false, out));

  EXPECT_EQ(out.n_contours, 1);
  EXPECT_TRUE(out.is_simple());
  EXPECT_EQ(out.bbox, (TTGlyphBox{-500, -700, 1000, 300}));

  ASSERT_TRUE(out.has_contours());
  const TTContourData& contours = *out.contours;

  ASSERT_EQ(contours.end_indices.size(), 1u);
  EXPECT_EQ(contours.end_indices[0], 4u);
  EXPECT_EQ(contours.instruction_length, 2u);
  EXPECT_EQ(contours.instructions, (std::vector<uint8_t>{ 0xB0, 0x01 }));

  ASSERT_EQ(contours.points.size(), contour.size());
  for (size_t i = 0; i < contour.size(); i++) {
    EXPECT_EQ(contours.points[i].x, contour[i].x) << "Point #" << i;
    EXPECT_EQ(contours.points[i].y, contour[i].y) << "Point #" << i;
    EXPECT_EQ(contours.points[i].on_curve, contour[i].on_curve) << "Point #" << i;
  }
}

TEST(opentype_glyf, repeat_and_plain_flags_decode_the_same) {
  // Equal steps along the x axis produce a run of equal flags.
  SFNTBuilder::Contour line {
    { 0, 0, true },
    { 10, 0, true },
    { 20, 0, true },
    { 30, 0, true }
  };
  std::vector<SFNTBuilder::Contour> contours { SFNTBuilder::square_contour(), line };

  std::vector<uint8_t> compressed = SFNTBuilder::build_simple_glyph(contours, {}, true);
  std::vector<uint8_t> plain = SFNTBuilder::build_simple_glyph(contours, {}, false);
  EXPECT_LT(compressed.size(), plain.size());

  TTGlyph a {};
  TTGlyph b {};
  ASSERT_SUCCESS(GlyfImpl::decode_glyph(raw_table_of(compressed), 0, uint32_t(compressed.size()), false, a));
  ASSERT_SUCCESS(GlyfImpl::decode_glyph(raw_table_of(plain), 0, uint32_t(plain.size()), false, b));

  ASSERT_TRUE(a.has_contours());
  ASSERT_TRUE(b.has_contours());
  EXPECT_EQ(a.contours->end_indices, (std::vector<uint16_t>{ 3, 7 }));
  EXPECT_EQ(a.contours->end_indices, b.contours->end_indices);

  // Flags are kept as stored, so they only match with the repeat bit masked out.
  const std::vector<TTContourPoint>& pa = a.contours->points;
  const std::vector<TTContourPoint>& pb = b.contours->points;

  ASSERT_EQ(pa.size(), pb.size());
  for (size_t i = 0; i < pa.size(); i++) {
    EXPECT_EQ(pa[i].x, pb[i].x) << "Point #" << i;
    EXPECT_EQ(pa[i].y, pb[i].y) << "Point #" << i;
    EXPECT_EQ(pa[i].on_curve, pb[i].on_curve) << "Point #" << i;
    EXPECT_EQ(pa[i].flag & ~0x08u, pb[i].flag & ~0x08u) << "Point #" << i;
    EXPECT_EQ(pb[i].flag & 0x08u, 0u) << "Point #" << i;
  }
}

TEST(opentype_glyf, composite_and_empty_glyphs) {
  std::vector<uint8_t> glyf = SFNTBuilder::build_glyph_header(-1, 1, 2, 3, 4);

  TTGlyph composite {};
  ASSERT_SUCCESS(GlyfImpl::decode_glyph(raw_table_of(glyf), 0, uint32_t(glyf.size()), false, composite));
  EXPECT_TRUE(composite.is_composite());
  EXPECT_FALSE(composite.has_contours());
  EXPECT_EQ(composite.bbox, (TTGlyphBox{1, 2, 3, 4}));

  TTGlyph empty {};
  ASSERT_SUCCESS(GlyfImpl::decode_glyph(raw_table_of(glyf), 4, 4, false, empty));
  EXPECT_EQ(empty.n_contours, 0);
  EXPECT_FALSE(empty.has_contours());
  EXPECT_EQ(empty.point_count(), 0u);
}

TEST(opentype_glyf, skip_outlines_keeps_header) {
  std::vector<uint8_t> glyph = SFNTBuilder::build_simple_glyph({ SFNTBuilder::square_contour() });

  TTGlyph out {};
  ASSERT_SUCCESS(GlyfImpl::decode_glyph(raw_table_of(glyph), 0, uint32_t(glyph.size()), true, out));
  EXPECT_EQ(out.n_contours, 1);
  EXPECT_EQ(out.bbox, (TTGlyphBox{100, 100, 700, 700}));
  EXPECT_FALSE(out.has_contours());
}

TEST(opentype_glyf, glyph_beyond_table_is_out_of_bounds) {
  std::vector<uint8_t> glyph = SFNTBuilder::build_simple_glyph({ SFNTBuilder::square_contour() });

  TTGlyph out {};
  EXPECT_EQ(GlyfImpl::decode_glyph(raw_table_of(glyph), 0, uint32_t(glyph.size()) + 2u, false, out), TTResult(TT_ERROR_OUT_OF_BOUNDS));
  EXPECT_EQ(GlyfImpl::decode_glyph(raw_table_of(glyph), 0, 6, false, out), TTResult(TT_ERROR_OUT_OF_BOUNDS));
}

TEST(opentype_glyf, loca_formats) {
  {
    SFNTBuilder::ByteWriter w;
    w.u16(0).u16(100);

    TTLocaTable loca {};
    ASSERT_SUCCESS(GlyfImpl::read_loca(raw_table_of(w.data), 0, 1, loca));
    EXPECT_EQ(loca.format, 0u);
    EXPECT_EQ(loca.offsets, (std::vector<uint32_t>{ 0, 200 }));
  }

  {
    SFNTBuilder::ByteWriter w;
    w.u32(0).u32(200);

    TTLocaTable loca {};
    ASSERT_SUCCESS(GlyfImpl::read_loca(raw_table_of(w.data), 1, 1, loca));
    EXPECT_EQ(loca.format, 1u);
    EXPECT_EQ(loca.offsets, (std::vector<uint32_t>{ 0, 200 }));
  }
}

TEST(opentype_glyf, loca_errors) {
  SFNTBuilder::ByteWriter w;
  w.u16(0).u16(100);

  TTLocaTable loca {};
  EXPECT_EQ(GlyfImpl::read_loca(raw_table_of(w.data), 0, 2, loca), TTResult(TT_ERROR_OUT_OF_BOUNDS));
  EXPECT_EQ(GlyfImpl::read_loca(raw_table_of(w.data), 1, 1, loca), TTResult(TT_ERROR_OUT_OF_BOUNDS));
  EXPECT_EQ(GlyfImpl::read_loca(raw_table_of(w.data), 2, 1, loca), TTResult(TT_ERROR_INVALID_DATA));
}

TEST(opentype_glyf, glyph_ranges) {
  TTLocaTable loca {};
  loca.offsets = { 0, 40, 40, 20 };

  uint32_t start = 0;
  uint32_t end = 0;

  EXPECT_SUCCESS(GlyfImpl::resolve_glyph_range(loca, 0, start, end));
  EXPECT_EQ(start, 0u);
  EXPECT_EQ(end, 40u);

  EXPECT_SUCCESS(GlyfImpl::resolve_glyph_range(loca, 1, start, end));
  EXPECT_EQ(start, end);

  EXPECT_EQ(GlyfImpl::resolve_glyph_range(loca, 2, start, end), TTResult(TT_ERROR_INVALID_DATA));
  EXPECT_EQ(GlyfImpl::resolve_glyph_range(loca, 3, start, end), TTResult(TT_ERROR_OUT_OF_BOUNDS));
}

} // {Tests}
} // {tt::OpenType}

#endif // TT_TEST
