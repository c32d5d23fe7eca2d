// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/trace_p.h>
#include <ttkit/opentype/otface_p.h>
#include <ttkit/opentype/otkern_p.h>
#include <ttkit/support/containerops_p.h>

namespace tt::OpenType {
namespace KernImpl {

// tt::OpenType::KernImpl - Trace
// ==============================

#if defined(TT_TRACE_OT_ALL) || defined(TT_TRACE_OT_KERN)
#define Trace TTDebugTrace
#else
#define Trace TTDummyTrace
#endif

// tt::OpenType::KernImpl - Decode
// ===============================

TTResult decode_sub_table(RawTable kern, uint32_t offset, TTKernSubtable& out) noexcept {
  typedef KernTable::WinGroupHeader WinGroupHeader;

  if (TT_UNLIKELY(!kern.fits(offset, WinGroupHeader::kBaseSize)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  const WinGroupHeader* group = kern.data_as<WinGroupHeader>(offset);
  out.version = group->version();
  out.length = group->length();
  out.coverage = TTKernCoverage::from_raw(group->coverage());

  if (out.coverage.format != 0)
    return tt_make_error(TT_ERROR_UNSUPPORTED_KERN_FORMAT);

  uint32_t format_offset = offset + WinGroupHeader::kBaseSize;
  if (TT_UNLIKELY(!kern.fits(format_offset, KernTable::Format0::kBaseSize)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  const KernTable::Format0* format0 = kern.data_as<KernTable::Format0>(format_offset);
  out.n_pairs = format0->pair_count();
  out.search_range = format0->search_range();
  out.entry_selector = format0->entry_selector();
  out.range_shift = format0->range_shift();

  // Pairs are sorted to make a binary search possible, but a linear decode doesn't need that.
  uint32_t pair_offset = format_offset + KernTable::Format0::kBaseSize;
  uint32_t pair_count = out.n_pairs;

  if (TT_UNLIKELY(!kern.fits(pair_offset, size_t(pair_count) * KernTable::Pair::kBaseSize)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  out.pairs.clear();
  TT_PROPAGATE(ContainerOps::reserve(out.pairs, pair_count));

  const KernTable::Pair* pairs = kern.data_as<KernTable::Pair>(pair_offset);
  for (uint32_t i = 0; i < pair_count; i++) {
    TTKernPair key {pairs[i].left(), pairs[i].right()};
    TT_PROPAGATE(ContainerOps::assign(out.pairs, key, pairs[i].value()));
  }

  return TT_SUCCESS;
}

// tt::OpenType::KernImpl - Apply
// ==============================

static constexpr int32_t kKernMaskOverride = 0x0;
static constexpr int32_t kKernMaskMinimum = 0x1;
static constexpr int32_t kKernMaskCombine = -1;

// Calculates the mask required by `combine_kern_value()` from coverage `flags`.
static TT_INLINE int32_t mask_from_kern_coverage(const TTKernCoverage& coverage) noexcept {
  if (coverage.is_override())
    return kKernMaskOverride;
  else if (coverage.is_minimum())
    return kKernMaskMinimum;
  else
    return kKernMaskCombine;
}

static TT_INLINE int32_t combine_kern_value(int32_t orig_val, int32_t new_val, int32_t mask) noexcept {
  if (mask == kKernMaskMinimum)
    return tt_min<int32_t>(orig_val, new_val); // Handles 'minimum' function.
  else
    return (orig_val & mask) + new_val;       // Handles both 'add' and 'override' functions.
}

int32_t kerning(const TTKernTable& table, uint32_t left, uint32_t right) noexcept {
  if (TT_UNLIKELY(left > 0xFFFFu || right > 0xFFFFu))
    return 0;

  TTKernPair key {uint16_t(left), uint16_t(right)};
  int32_t value = 0;

  for (const TTKernSubtable& sub_table : table.subtables) {
    if (!sub_table.coverage.is_horizontal() || sub_table.coverage.is_cross_stream())
      continue;

    auto it = sub_table.pairs.find(key);
    if (it != sub_table.pairs.end())
      value = combine_kern_value(value, it->second, mask_from_kern_coverage(sub_table.coverage));
  }

  return value;
}

// tt::OpenType::KernImpl - Init
// =============================

TTResult init(OTFontImpl* ot_font_impl, OTFaceTables& tables) noexcept {
  typedef KernTable::WinGroupHeader WinGroupHeader;

  Table<KernTable> kern = tables.kern;
  if (!kern)
    return TT_SUCCESS;

  Trace trace;
  trace.info("tt::OpenType::OTFontImpl::Init 'kern' [Size=%u]\n", kern.size);
  trace.indent();

  if (TT_UNLIKELY(!kern.fits())) {
    trace.warn("Table is truncated\n");
    ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_KERN_DATA;
    return TT_SUCCESS;
  }

  // Kern Header
  // -----------

  TTKernTable out {};
  out.version = kern->header.version();
  out.n_tables = kern->header.table_count();

  // Apple's variant uses a 32-bit version, which starts with 0x0001. Only the Windows variant is supported.
  if (out.version != 0) {
    trace.warn("Unsupported version [%u]\n", out.version);
    ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_KERN_DATA;
    return TT_SUCCESS;
  }

  trace.info("Version: 0 (WINDOWS)\n");
  trace.info("GroupCount: %u\n", out.n_tables);

  // Kern Groups
  // -----------

  uint32_t offset = KernTable::kBaseSize;
  for (uint32_t group_index = 0; group_index < out.n_tables; group_index++) {
    uint32_t remaining_size = kern.size - offset;
    if (TT_UNLIKELY(remaining_size < WinGroupHeader::kBaseSize)) {
      trace.warn("No more data for group #%u\n", group_index);
      ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_KERN_DATA;
      break;
    }

    uint32_t length = kern.data_as<WinGroupHeader>(offset)->length();
    if (TT_UNLIKELY(length < WinGroupHeader::kBaseSize || length > remaining_size)) {
      trace.warn("Group #%u has invalid length [%u], %u bytes remaining\n", group_index, length, remaining_size);
      ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_KERN_DATA;
      break;
    }

    trace.info("Group #%u [Offset=%u Length=%u]\n", group_index, offset, length);
    trace.indent();

    TTKernSubtable sub_table {};
    TTResult result = decode_sub_table(kern, offset, sub_table);

    if (result == TT_ERROR_UNSUPPORTED_KERN_FORMAT) {
      trace.warn("Format %u is not supported\n", sub_table.coverage.format);
      ot_font_impl->diag_flags |= TT_FONT_DIAG_WRONG_KERN_FORMAT;
    }
    else if (TT_UNLIKELY(result != TT_SUCCESS)) {
      trace.fail("Pair data is truncated\n");
      return result;
    }
    else {
      trace.info("Coverage: 0x%02X\n", sub_table.coverage.flags);
      trace.info("PairCount: %u\n", sub_table.n_pairs);
      TT_PROPAGATE(ContainerOps::append(out.subtables, std::move(sub_table)));
    }

    trace.deindent();
    offset += length;
  }

  return ot_font_impl->assign_payload(TT_MAKE_TAG('k', 'e', 'r', 'n'), std::move(out));
}

} // {KernImpl}
} // {tt::OpenType}
