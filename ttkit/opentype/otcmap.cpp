// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/trace_p.h>
#include <ttkit/opentype/otcmap_p.h>
#include <ttkit/opentype/otface_p.h>
#include <ttkit/support/containerops_p.h>

namespace tt::OpenType {
namespace CMapImpl {

// tt::OpenType::CMapImpl - Trace
// ==============================

#if defined(TT_TRACE_OT_ALL) || defined(TT_TRACE_OT_CMAP)
#define Trace TTDebugTrace
#else
#define Trace TTDummyTrace
#endif

// tt::OpenType::CMapImpl - Utilities
// ==================================

static TT_INLINE TTResult record_mapping(TTCMapTable& out, uint32_t code, uint32_t glyph_id) noexcept {
  TT_PROPAGATE(ContainerOps::assign(out.glyph_to_char, glyph_id, code));
  TT_PROPAGATE(ContainerOps::assign(out.char_to_glyph, code, glyph_id));
  return TT_SUCCESS;
}

// tt::OpenType::CMapImpl - Format 4
// =================================

TTResult decode_format4(RawTable sub_table, TTCMapTable& out) noexcept {
  typedef CMapTable::Format4 Format4;

  if (TT_UNLIKELY(!sub_table.fits(Format4::kBaseSize)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  const Format4* f4 = sub_table.data_as<Format4>();
  uint32_t num_segs = uint32_t(f4->num_segs_x2()) / 2u;

  // All parallel arrays (including the pad) must be present.
  if (TT_UNLIKELY(!sub_table.fits(Format4::glyph_id_offset(num_segs))))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  if (num_segs) {
    uint32_t pad = 0;
    uint32_t last_end = 0;

    TT_PROPAGATE(sub_table.read_u16(Format4::pad_offset(num_segs), pad));
    TT_PROPAGATE(sub_table.read_u16(Format4::last_char_offset() + (num_segs - 1u) * 2u, last_end));

    if (pad != 0 && last_end != 0xFFFFu)
      return tt_make_error(TT_ERROR_MALFORMED_CMAP);
  }

  for (uint32_t i = 0; i < num_segs; i++) {
    uint32_t end_code;
    uint32_t start_code;
    int32_t id_delta;
    uint32_t id_range_offset;

    TT_PROPAGATE(sub_table.read_u16(Format4::last_char_offset() + i * 2u, end_code));
    TT_PROPAGATE(sub_table.read_u16(Format4::first_char_offset(num_segs) + i * 2u, start_code));
    TT_PROPAGATE(sub_table.read_i16(Format4::id_delta_offset(num_segs) + i * 2u, id_delta));

    // The indirect glyph address is relative to the position of the segment's own `id_range_offset` entry.
    uint32_t id_range_offset_pos = Format4::id_offset_offset(num_segs) + i * 2u;
    TT_PROPAGATE(sub_table.read_u16(id_range_offset_pos, id_range_offset));

    for (uint32_t code = start_code; code <= end_code; code++) {
      uint32_t glyph_id;

      if (id_range_offset == 0) {
        glyph_id = (code + uint32_t(id_delta)) & 0xFFFFu;
      }
      else {
        size_t glyph_pos = size_t(id_range_offset_pos) + id_range_offset + (code - start_code) * 2u;
        TT_PROPAGATE(sub_table.read_u16(glyph_pos, glyph_id));
      }

      TT_PROPAGATE(record_mapping(out, code, glyph_id));
    }
  }

  return TT_SUCCESS;
}

// tt::OpenType::CMapImpl - Format 12
// ==================================

TTResult decode_format12(RawTable sub_table, TTCMapTable& out) noexcept {
  typedef CMapTable::Format12 Format12;
  typedef CMapTable::Group Group;

  if (TT_UNLIKELY(!sub_table.fits(Format12::kBaseSize)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  const Format12* f12 = sub_table.data_as<Format12>();
  uint32_t group_count = f12->group_count();

  if (TT_UNLIKELY(!sub_table.fits(Format12::kBaseSize, size_t(group_count) * Group::kBaseSize)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  const Group* groups = f12->group_array();
  for (uint32_t i = 0; i < group_count; i++) {
    uint32_t first = groups[i].first();
    uint32_t last = groups[i].last();

    if (TT_UNLIKELY(first > last || last > kMaxCodePoint))
      return tt_make_error(TT_ERROR_MALFORMED_CMAP);
  }

  for (uint32_t i = 0; i < group_count; i++) {
    uint32_t first = groups[i].first();
    uint32_t last = groups[i].last();
    uint32_t glyph_id = groups[i].glyph_id();

    for (uint32_t code = first; code <= last; code++, glyph_id++)
      TT_PROPAGATE(record_mapping(out, code, glyph_id));
  }

  return TT_SUCCESS;
}

// tt::OpenType::CMapImpl - Init
// =============================

static TTResult report_no_mapping(OTFontImpl* ot_font_impl, Trace& trace) noexcept {
  ot_font_impl->cmap_status = tt_make_error(TT_ERROR_UNSUPPORTED_FONT);
  ot_font_impl->diag_flags |= TT_FONT_DIAG_NO_CHARACTER_MAPPING;

  if (ot_font_impl->has_decode_flag(TT_FONT_DECODE_STRICT_CMAP)) {
    trace.fail("No usable character mapping\n");
    return ot_font_impl->cmap_status;
  }

  trace.warn("No usable character mapping\n");
  return TT_SUCCESS;
}

TTResult init(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept {
  typedef CMapTable::Encoding Encoding;

  Table<CMapTable> cmap = tables.cmap;

  Trace trace;
  trace.info("tt::OpenType::OTFontImpl::Init 'cmap' [Size=%u]\n", cmap.size);
  trace.indent();

  if (!cmap)
    return report_no_mapping(ot_font_impl, trace);

  if (TT_UNLIKELY(!cmap.fits())) {
    trace.fail("Table is truncated\n");
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);
  }

  TTCMapTable out {};
  out.version = cmap->version();

  uint32_t count = cmap->count();
  if (TT_UNLIKELY(!cmap.fits(CMapTable::kBaseSize, size_t(count) * Encoding::kBaseSize))) {
    trace.fail("Encoding records are truncated [Count=%u]\n", count);
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);
  }

  trace.info("Version: %u\n", out.version);
  trace.info("Count: %u\n", count);

  TT_PROPAGATE(ContainerOps::reserve(out.encodings, count));

  const Encoding* encodings = cmap->encoding_array();
  for (uint32_t i = 0; i < count; i++) {
    TTCMapEncodingRecord record {};
    record.platform_id = encodings[i].platform_id();
    record.encoding_id = encodings[i].encoding_id();
    record.offset = encodings[i].offset();
    TT_PROPAGATE(ContainerOps::append(out.encodings, record));
  }

  for (uint32_t i = 0; i < count; i++) {
    const TTCMapEncodingRecord& record = out.encodings[i];
    if (!is_supported_encoding(record.platform_id, record.encoding_id))
      continue;

    uint32_t format;
    TT_PROPAGATE(cmap.read_u16(record.offset, format));

    trace.info("Encoding #%u [Platform=%u Encoding=%u Offset=%u Format=%u]\n",
               i, record.platform_id, record.encoding_id, record.offset, format);
    trace.indent();

    RawTable sub_table = cmap.sub_table(record.offset);
    TTResult result = TT_SUCCESS;

    switch (format) {
      case 4:
        result = decode_format4(sub_table, out);
        break;

      case 12:
        result = decode_format12(sub_table, out);
        break;

      default:
        trace.warn("Format %u is not supported\n", format);
        ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_CMAP_FORMAT;
        trace.deindent();
        continue;
    }

    if (result == TT_ERROR_MALFORMED_CMAP) {
      trace.warn("Subtable is malformed, skipping\n");
      ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_CMAP_DATA;
    }
    else if (TT_UNLIKELY(result != TT_SUCCESS)) {
      trace.fail("Subtable is truncated\n");
      return result;
    }
    else {
      TT_PROPAGATE(ContainerOps::append(out.decoded_formats, uint16_t(format)));
    }

    trace.deindent();
  }

  trace.info("Mappings: %zu\n", out.char_to_glyph.size());

  bool has_mapping = !out.decoded_formats.empty();
  TT_PROPAGATE(ot_font_impl->assign_payload(TT_MAKE_TAG('c', 'm', 'a', 'p'), std::move(out)));

  if (!has_mapping)
    return report_no_mapping(ot_font_impl, trace);

  return TT_SUCCESS;
}

} // {CMapImpl}
} // {tt::OpenType}
