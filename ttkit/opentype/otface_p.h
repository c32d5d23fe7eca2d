// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_OPENTYPE_OTFACE_P_H_INCLUDED
#define TTKIT_OPENTYPE_OTFACE_P_H_INCLUDED

#include <ttkit/core/fontdata.h>
#include <ttkit/opentype/otdefs_p.h>

#include <new>

//! \cond INTERNAL
//! \addtogroup tt_opentype_impl
//! \{

namespace tt::OpenType {

//! Raw data of all tables the decoders need, resolved from the table directory.
struct OTFaceTables {
  RawTable head;
  RawTable maxp;
  RawTable cmap;
  RawTable kern;
  RawTable loca;
  RawTable glyf;

  TT_INLINE void init(const TTFontData& font_data) noexcept {
    head = from_font_data(font_data, TT_MAKE_TAG('h', 'e', 'a', 'd'));
    maxp = from_font_data(font_data, TT_MAKE_TAG('m', 'a', 'x', 'p'));
    cmap = from_font_data(font_data, TT_MAKE_TAG('c', 'm', 'a', 'p'));
    kern = from_font_data(font_data, TT_MAKE_TAG('k', 'e', 'r', 'n'));
    loca = from_font_data(font_data, TT_MAKE_TAG('l', 'o', 'c', 'a'));
    glyf = from_font_data(font_data, TT_MAKE_TAG('g', 'l', 'y', 'f'));
  }

  static TT_INLINE RawTable from_font_data(const TTFontData& font_data, TTTag tag) noexcept {
    TTFontTableData table = font_data.table_data(tag);
    return RawTable(table.data, uint32_t(table.size));
  }
};

//! Decoded font under construction.
//!
//! The decode pipeline passes this builder explicitly through all decoders, there is no other state shared between
//! them. When the pipeline succeeds the builder is frozen and shared by all \ref TTFont instances referencing it.
struct OTFontImpl {
  //! Font data (raw bytes and table directory).
  TTFontData font_data;
  //! All tables declared by the directory, tables that were not decoded hold `std::monostate`.
  TTFontTableMap tables;

  //! Decode flags passed to the entry point.
  TTFontDecodeFlags decode_flags;
  //! Diagnostics collected during decoding.
  TTFontDiagFlags diag_flags;
  //! Status of the character mapping (either success or \ref TT_ERROR_UNSUPPORTED_FONT).
  TTResult cmap_status;

  //! Number of glyphs as specified by 'maxp' table.
  uint16_t num_glyphs;
  //! Format of 'loca' table as specified by 'head' table.
  uint16_t index_to_loc_format;

  TT_INLINE OTFontImpl() noexcept
    : decode_flags(TT_FONT_DECODE_NO_FLAGS),
      diag_flags(TT_FONT_DIAG_NO_FLAGS),
      cmap_status(TT_SUCCESS),
      num_glyphs(0),
      index_to_loc_format(0) {}

  TT_NONCOPYABLE(OTFontImpl)

  TT_INLINE bool has_decode_flag(TTFontDecodeFlags flag) const noexcept { return tt_test_flag(decode_flags, flag); }

  //! Returns a decoded payload of the given table or null if the table is not present or not decoded as `T`.
  template<typename T>
  TT_INLINE const T* payload(TTTag tag) const noexcept {
    auto it = tables.find(tag);
    return it != tables.end() ? it->second.payload_as<T>() : nullptr;
  }

  //! Stores a decoded `payload` of a table of the given `tag`, which must be declared by the directory.
  template<typename T>
  TT_INLINE TTResult assign_payload(TTTag tag, T&& payload) noexcept {
    auto it = tables.find(tag);
    if (TT_UNLIKELY(it == tables.end()))
      return tt_make_error(TT_ERROR_INVALID_STATE);

    try {
      it->second.payload = std::forward<T>(payload);
      return TT_SUCCESS;
    }
    catch (const std::bad_alloc&) {
      return tt_make_error(TT_ERROR_OUT_OF_MEMORY);
    }
  }
};

//! Decodes all supported tables of `ot_font_impl->font_data`.
TTResult init_open_type_font(OTFontImpl* ot_font_impl, TTFontDecodeFlags decode_flags) noexcept;

} // {tt::OpenType}

//! \}
//! \endcond

#endif // TTKIT_OPENTYPE_OTFACE_P_H_INCLUDED
