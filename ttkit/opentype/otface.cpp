// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/trace_p.h>
#include <ttkit/opentype/otcmap_p.h>
#include <ttkit/opentype/otcore_p.h>
#include <ttkit/opentype/otface_p.h>
#include <ttkit/opentype/otglyf_p.h>
#include <ttkit/opentype/otkern_p.h>
#include <ttkit/support/containerops_p.h>

namespace tt::OpenType {

// tt::OpenType::OTFontImpl - Trace
// ================================

#if defined(TT_TRACE_OT_ALL) || defined(TT_TRACE_OT_CORE)
#define Trace TTDebugTrace
#else
#define Trace TTDummyTrace
#endif

// tt::OpenType::OTFontImpl - Init
// ===============================

static TTResult init_table_map(OTFontImpl* ot_font_impl) noexcept {
  for (const TTTableRecord& record : ot_font_impl->font_data.table_records()) {
    TTFontTable table {};
    table.record = record;
    TT_PROPAGATE(ContainerOps::assign(ot_font_impl->tables, record.tag, std::move(table)));
  }
  return TT_SUCCESS;
}

static TTResult verify_checksums(OTFontImpl* ot_font_impl) noexcept {
  Trace trace;
  trace.info("tt::OpenType::OTFontImpl::VerifyChecksums\n");
  trace.indent();

  for (const TTTableRecord& record : ot_font_impl->font_data.table_records()) {
    uint32_t check_sum;
    TT_PROPAGATE(ot_font_impl->font_data.calc_table_checksum(record, &check_sum));

    if (check_sum != record.check_sum) {
      trace.warn("Table '%c%c%c%c' has wrong checksum [0x%08X], expected 0x%08X\n",
                 char((record.tag >> 24) & 0xFF),
                 char((record.tag >> 16) & 0xFF),
                 char((record.tag >>  8) & 0xFF),
                 char((record.tag >>  0) & 0xFF),
                 check_sum, record.check_sum);
      ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_TABLE_CHECKSUM;
    }
  }

  return TT_SUCCESS;
}

TTResult init_open_type_font(OTFontImpl* ot_font_impl, TTFontDecodeFlags decode_flags) noexcept {
  ot_font_impl->decode_flags = decode_flags;

  OTFaceTables tables;
  tables.init(ot_font_impl->font_data);

  TT_PROPAGATE(init_table_map(ot_font_impl));

  if (ot_font_impl->has_decode_flag(TT_FONT_DECODE_VERIFY_CHECKSUMS))
    TT_PROPAGATE(verify_checksums(ot_font_impl));

  // 'head' provides the loca format and 'maxp' the glyph count, both required by glyph decoding.
  TT_PROPAGATE(CoreImpl::init(ot_font_impl, tables));

  if (!ot_font_impl->has_decode_flag(TT_FONT_DECODE_SKIP_KERN))
    TT_PROPAGATE(KernImpl::init(ot_font_impl, tables));

  TT_PROPAGATE(CMapImpl::init(ot_font_impl, tables));
  TT_PROPAGATE(GlyfImpl::init(ot_font_impl, tables));

  return TT_SUCCESS;
}

} // {tt::OpenType}
