// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/trace_p.h>
#include <ttkit/opentype/otcore_p.h>
#include <ttkit/opentype/otface_p.h>

namespace tt::OpenType {
namespace CoreImpl {

// tt::OpenType::CoreImpl - Trace
// ==============================

#if defined(TT_TRACE_OT_ALL) || defined(TT_TRACE_OT_CORE)
#define Trace TTDebugTrace
#else
#define Trace TTDummyTrace
#endif

// tt::OpenType::CoreImpl - Utilities
// ==================================

static TT_INLINE const char* size_check_message(size_t size) noexcept {
  return size ? "Table is truncated" : "Table not found";
}

// tt::OpenType::CoreImpl - Init
// =============================

static TTResult init_head(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept {
  Table<HeadTable> head = tables.head;

  Trace trace;
  trace.info("tt::OpenType::OTFontImpl::InitHead [Size=%u]\n", head.size);
  trace.indent();

  if (!head.fits()) {
    trace.fail("%s\n", size_check_message(head.size));
    return tt_make_error(head.size ? TT_ERROR_OUT_OF_BOUNDS : TT_ERROR_FONT_MISSING_IMPORTANT_TABLE);
  }

  constexpr uint16_t kMinUnitsPerEm = 16;
  constexpr uint16_t kMaxUnitsPerEm = 16384;

  TTHeadTable out {};
  out.version = head->version();
  out.revision = head->revision();
  out.check_sum_adjustment = head->check_sum_adjustment();
  out.magic_number = head->magic_number();
  out.flags = head->flags();
  out.units_per_em = head->units_per_em();
  out.created = head->created();
  out.modified = head->modified();
  out.x_min = head->x_min();
  out.y_min = head->y_min();
  out.x_max = head->x_max();
  out.y_max = head->y_max();
  out.mac_style = head->mac_style();
  out.lowest_rec_ppem = head->lowest_rec_ppem();
  out.font_direction_hint = head->font_direction_hint();
  out.index_to_loc_format = head->index_to_loc_format();
  out.glyph_data_format = head->glyph_data_format();

  trace.info("Revision: %u.%u\n", out.revision >> 16, out.revision & 0xFFFFu);
  trace.info("Flags: 0x%04X\n", out.flags);
  trace.info("UnitsPerEm: %u\n", out.units_per_em);
  trace.info("BoundingBox: [%d %d %d %d]\n", out.x_min, out.y_min, out.x_max, out.y_max);
  trace.info("IndexToLocFormat: %u\n", out.index_to_loc_format);

  if (TT_UNLIKELY(out.magic_number != HeadTable::kMagicNumber)) {
    trace.warn("Invalid MagicNumber [0x%08X], expected 0x%08X\n", out.magic_number, uint32_t(HeadTable::kMagicNumber));
    ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_HEAD_DATA;
  }

  if (TT_UNLIKELY(out.units_per_em < kMinUnitsPerEm || out.units_per_em > kMaxUnitsPerEm)) {
    trace.warn("Invalid UnitsPerEm [%u], should be within [%u:%u] range\n", out.units_per_em, kMinUnitsPerEm, kMaxUnitsPerEm);
    ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_HEAD_DATA;
  }

  if (out.index_to_loc_format > HeadTable::kIndexToLocUInt32) {
    trace.fail("Invalid IndexToLocFormat [%u], expected [0:1]\n", out.index_to_loc_format);
    return tt_make_error(TT_ERROR_INVALID_DATA);
  }

  ot_font_impl->index_to_loc_format = out.index_to_loc_format;
  return ot_font_impl->assign_payload(TT_MAKE_TAG('h', 'e', 'a', 'd'), out);
}

static TTResult init_maxp(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept {
  Table<MaxPTable> maxp = tables.maxp;

  Trace trace;
  trace.info("tt::OpenType::OTFontImpl::InitMaxP [Size=%u]\n", maxp.size);
  trace.indent();

  if (!maxp.fits()) {
    trace.fail("%s\n", size_check_message(maxp.size));
    return tt_make_error(maxp.size ? TT_ERROR_OUT_OF_BOUNDS : TT_ERROR_FONT_MISSING_IMPORTANT_TABLE);
  }

  TTMaxPTable out {};
  out.version = maxp->v0_5()->version();
  out.num_glyphs = maxp->v0_5()->glyph_count();

  trace.info("Version: %u.%u\n", out.version >> 16, (out.version >> 12) & 0xFu);
  trace.info("GlyphCount: %u\n", out.num_glyphs);

  if (out.num_glyphs == 0) {
    trace.fail("Invalid GlyphCount [%u]\n", out.num_glyphs);
    return tt_make_error(TT_ERROR_INVALID_DATA);
  }

  // Version 1.0 provides limits of TrueType outlines, it's fine if it's truncated as only the count is required.
  if (out.version >= 0x00010000u && maxp.fits(MaxPTable::V1_0::kBaseSize)) {
    const MaxPTable::V1_0* v1 = maxp->v1_0();
    out.max_points = v1->max_points();
    out.max_contours = v1->max_contours();
    out.max_component_points = v1->max_component_points();
    out.max_component_contours = v1->max_component_contours();
    out.max_component_depth = v1->max_component_depth();

    trace.info("MaxPoints: %u\n", out.max_points);
    trace.info("MaxContours: %u\n", out.max_contours);
  }

  ot_font_impl->num_glyphs = out.num_glyphs;
  return ot_font_impl->assign_payload(TT_MAKE_TAG('m', 'a', 'x', 'p'), out);
}

TTResult init(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept {
  TT_PROPAGATE(init_head(ot_font_impl, tables));
  TT_PROPAGATE(init_maxp(ot_font_impl, tables));
  return TT_SUCCESS;
}

} // {CoreImpl}
} // {tt::OpenType}
