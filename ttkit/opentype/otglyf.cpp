// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/trace_p.h>
#include <ttkit/opentype/otcore_p.h>
#include <ttkit/opentype/otface_p.h>
#include <ttkit/opentype/otglyf_p.h>
#include <ttkit/support/containerops_p.h>

namespace tt::OpenType {
namespace GlyfImpl {

// tt::OpenType::GlyfImpl - Trace
// ==============================

#if defined(TT_TRACE_OT_ALL) || defined(TT_TRACE_OT_GLYF)
#define Trace TTDebugTrace
#else
#define Trace TTDummyTrace
#endif

// tt::OpenType::GlyfImpl - Loca
// =============================

TTResult read_loca(RawTable loca, uint32_t format, uint32_t glyph_count, TTLocaTable& out) noexcept {
  uint32_t entry_size = format == HeadTable::kIndexToLocUInt16 ? 2u : 4u;
  uint32_t entry_count = glyph_count + 1u;

  if (TT_UNLIKELY(format > HeadTable::kIndexToLocUInt32))
    return tt_make_error(TT_ERROR_INVALID_DATA);

  if (TT_UNLIKELY(!loca.fits(size_t(entry_count) * entry_size)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  out.format = uint16_t(format);
  out.offsets.clear();
  TT_PROPAGATE(ContainerOps::reserve(out.offsets, entry_count));

  if (entry_size == 2u) {
    const UInt16* offset_array = loca.data_as<UInt16>();
    for (uint32_t i = 0; i < entry_count; i++)
      TT_PROPAGATE(ContainerOps::append(out.offsets, uint32_t(offset_array[i].value()) * 2u));
  }
  else {
    const UInt32* offset_array = loca.data_as<UInt32>();
    for (uint32_t i = 0; i < entry_count; i++)
      TT_PROPAGATE(ContainerOps::append(out.offsets, offset_array[i].value()));
  }

  return TT_SUCCESS;
}

TTResult resolve_glyph_range(const TTLocaTable& loca, uint32_t glyph_id, uint32_t& start, uint32_t& end) noexcept {
  if (TT_UNLIKELY(size_t(glyph_id) + 1u >= loca.offsets.size()))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  start = loca.offsets[glyph_id];
  end = loca.offsets[glyph_id + 1u];

  if (TT_UNLIKELY(start > end))
    return tt_make_error(TT_ERROR_INVALID_DATA);

  return TT_SUCCESS;
}

// tt::OpenType::GlyfImpl - Simple Glyph
// =====================================

// Decodes a single coordinate stream. `byte_flag` selects 8-bit deltas and `same_flag` either the sign of an 8-bit
// delta or a zero delta in case that the coordinate is not stored as a byte.
static TTResult decode_coordinates(
  RawTable glyph,
  size_t& offset,
  const std::vector<uint8_t>& flags,
  uint32_t byte_flag,
  uint32_t same_flag,
  int32_t TTContourPoint::*member,
  std::vector<TTContourPoint>& points) noexcept {

  int32_t value = 0;
  size_t count = flags.size();

  for (size_t i = 0; i < count; i++) {
    uint32_t flag = flags[i];

    if (flag & byte_flag) {
      uint32_t delta;
      TT_PROPAGATE(glyph.read_u8(offset, delta));
      offset++;
      value += (flag & same_flag) ? int32_t(delta) : -int32_t(delta);
    }
    else if (!(flag & same_flag)) {
      int32_t delta;
      TT_PROPAGATE(glyph.read_i16(offset, delta));
      offset += 2;
      value += delta;
    }

    points[i].*member = value;
  }

  return TT_SUCCESS;
}

TTResult decode_simple_glyph(RawTable glyph, uint32_t contour_count, TTContourData& out) noexcept {
  typedef GlyfTable::Simple Simple;

  size_t offset = GlyfTable::GlyphData::kBaseSize;

  // Contour end indices.
  out.end_indices.clear();
  TT_PROPAGATE(ContainerOps::reserve(out.end_indices, contour_count));

  for (uint32_t i = 0; i < contour_count; i++) {
    uint32_t end_index;
    TT_PROPAGATE(glyph.read_u16(offset, end_index));
    offset += 2;

    if (TT_UNLIKELY(i != 0 && end_index < out.end_indices.back()))
      return tt_make_error(TT_ERROR_INVALID_DATA);

    TT_PROPAGATE(ContainerOps::append(out.end_indices, uint16_t(end_index)));
  }

  // Instructions (opaque).
  uint32_t instruction_length;
  TT_PROPAGATE(glyph.read_u16(offset, instruction_length));
  offset += 2;

  if (TT_UNLIKELY(!glyph.fits(offset, instruction_length)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  out.instruction_length = uint16_t(instruction_length);
  out.instructions.clear();
  TT_PROPAGATE(ContainerOps::resize(out.instructions, instruction_length));
  if (instruction_length)
    memcpy(out.instructions.data(), glyph.data + offset, instruction_length);
  offset += instruction_length;

  size_t point_count = contour_count ? size_t(out.end_indices.back()) + 1u : size_t(0);

  // Flags - a repeated flag produces more flags than bytes consumed, so the loop is driven by the produced count.
  std::vector<uint8_t> flags;
  TT_PROPAGATE(ContainerOps::reserve(flags, point_count));

  while (flags.size() < point_count) {
    uint32_t flag;
    TT_PROPAGATE(glyph.read_u8(offset, flag));
    offset++;
    TT_PROPAGATE(ContainerOps::append(flags, uint8_t(flag)));

    if (flag & Simple::kRepeatFlag) {
      uint32_t repeat_count;
      TT_PROPAGATE(glyph.read_u8(offset, repeat_count));
      offset++;

      if (TT_UNLIKELY(repeat_count > point_count - flags.size()))
        return tt_make_error(TT_ERROR_INVALID_DATA);

      for (uint32_t i = 0; i < repeat_count; i++)
        TT_PROPAGATE(ContainerOps::append(flags, uint8_t(flag)));
    }
  }

  out.points.clear();
  TT_PROPAGATE(ContainerOps::resize(out.points, point_count));

  // X coordinates first, then Y coordinates continuing right after them.
  TT_PROPAGATE(decode_coordinates(glyph, offset, flags, Simple::kXIsByte, Simple::kXIsSameOrXByteIsPositive, &TTContourPoint::x, out.points));
  TT_PROPAGATE(decode_coordinates(glyph, offset, flags, Simple::kYIsByte, Simple::kYIsSameOrYByteIsPositive, &TTContourPoint::y, out.points));

  for (size_t i = 0; i < point_count; i++) {
    out.points[i].flag = flags[i];
    out.points[i].on_curve = (flags[i] & Simple::kOnCurvePoint) != 0;
  }

  return TT_SUCCESS;
}

// tt::OpenType::GlyfImpl - Glyph
// ==============================

TTResult decode_glyph(RawTable glyf, uint32_t start, uint32_t end, bool skip_outlines, TTGlyph& out) noexcept {
  out.n_contours = 0;
  out.bbox = TTGlyphBox{};
  out.contours.reset();

  // An empty glyph (for example a space) has no data at all.
  if (start == end)
    return TT_SUCCESS;

  RawTable glyph;
  TT_PROPAGATE(glyf.sub_table_checked(start, end - start, glyph));

  if (TT_UNLIKELY(!glyph.fits(GlyfTable::GlyphData::kBaseSize)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  const GlyfTable::GlyphData* header = glyph.data_as<GlyfTable::GlyphData>();
  out.n_contours = header->number_of_contours();
  out.bbox.x_min = header->x_min();
  out.bbox.y_min = header->y_min();
  out.bbox.x_max = header->x_max();
  out.bbox.y_max = header->y_max();

  // Compound glyphs are kept header-only.
  if (out.n_contours <= 0 || skip_outlines)
    return TT_SUCCESS;

  try {
    out.contours.emplace();
  }
  catch (const std::bad_alloc&) {
    return tt_make_error(TT_ERROR_OUT_OF_MEMORY);
  }

  return decode_simple_glyph(glyph, uint32_t(out.n_contours), *out.contours);
}

// tt::OpenType::GlyfImpl - Init
// =============================

TTResult init(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept {
  constexpr TTTag kLocaTag = TT_MAKE_TAG('l', 'o', 'c', 'a');
  constexpr TTTag kGlyfTag = TT_MAKE_TAG('g', 'l', 'y', 'f');

  Trace trace;
  trace.info("tt::OpenType::OTFontImpl::Init 'glyf' [Size=%u] 'loca' [Size=%u]\n", tables.glyf.size, tables.loca.size);
  trace.indent();

  if (!ot_font_impl->font_data.has_table(kLocaTag) || !ot_font_impl->font_data.has_table(kGlyfTag)) {
    trace.fail("Table not found\n");
    return tt_make_error(TT_ERROR_FONT_MISSING_IMPORTANT_TABLE);
  }

  uint32_t glyph_count = ot_font_impl->num_glyphs;
  bool skip_outlines = ot_font_impl->has_decode_flag(TT_FONT_DECODE_SKIP_OUTLINES);

  TTLocaTable loca {};
  TTResult result = read_loca(tables.loca, ot_font_impl->index_to_loc_format, glyph_count, loca);
  if (TT_UNLIKELY(result != TT_SUCCESS)) {
    trace.fail("Loca table is truncated [GlyphCount=%u Format=%u]\n", glyph_count, ot_font_impl->index_to_loc_format);
    return result;
  }

  TTGlyfTable glyf {};
  TT_PROPAGATE(ContainerOps::resize(glyf.glyphs, size_t(glyph_count) + 1u));

  for (uint32_t glyph_id = 0; glyph_id < glyph_count; glyph_id++) {
    TTGlyph& glyph = glyf.glyphs[glyph_id];
    glyph.id = glyph_id;

    uint32_t start;
    uint32_t end;

    result = resolve_glyph_range(loca, glyph_id, start, end);
    if (result == TT_SUCCESS)
      result = decode_glyph(tables.glyf, start, end, skip_outlines, glyph);

    if (TT_UNLIKELY(result != TT_SUCCESS)) {
      trace.fail("Glyph #%u is invalid [Result=0x%08X]\n", glyph_id, result);
      return result;
    }
  }

  // The sentinel glyph has no loca range of its own, it's header-only.
  glyf.glyphs[glyph_count].id = glyph_count;

  trace.info("GlyphCount: %u (+1)\n", glyph_count);

  TT_PROPAGATE(ot_font_impl->assign_payload(kLocaTag, std::move(loca)));
  TT_PROPAGATE(ot_font_impl->assign_payload(kGlyfTag, std::move(glyf)));

  return TT_SUCCESS;
}

} // {GlyfImpl}
} // {tt::OpenType}
