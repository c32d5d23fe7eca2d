// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_CORE_FONTDATA_H_INCLUDED
#define TTKIT_CORE_FONTDATA_H_INCLUDED

#include <ttkit/core/fontdefs.h>

#include <unordered_map>
#include <vector>

//! \addtogroup tt_text
//! \{

//! A read only view of a single font table.
struct TTFontTableData {
  //! Pointer to the beginning of the table data.
  const uint8_t* data;
  //! Size of the table in bytes.
  size_t size;

  TT_INLINE_NODEBUG bool is_empty() const noexcept { return size == 0; }
  TT_INLINE_NODEBUG void reset() noexcept { *this = TTFontTableData{}; }
};

//! Font data - raw bytes of a font file and its validated table directory.
//!
//! Font data either owns its bytes (\ref create_from_file() and the `std::vector` overload of
//! \ref create_from_data()) or references bytes provided by the user, which must outlive the font data in that case.
//! Font data is not copyable, but it's movable.
class TTFontData {
public:
  //! \name Construction & Destruction
  //! \{

  TT_API TTFontData() noexcept;
  TT_API TTFontData(TTFontData&& other) noexcept;
  TT_API ~TTFontData() noexcept;

  TT_API TTFontData& operator=(TTFontData&& other) noexcept;

  TTFontData(const TTFontData& other) = delete;
  TTFontData& operator=(const TTFontData& other) = delete;

  //! \}

  //! \name Create Functionality
  //! \{

  //! Reads the file specified by `file_name` and validates its table directory.
  TT_API TTResult create_from_file(const char* file_name) noexcept;

  //! Validates the table directory of `data` without copying it (the data must outlive this instance).
  TT_API TTResult create_from_data(const void* data, size_t size) noexcept;

  //! Takes the ownership of `storage` and validates its table directory.
  TT_API TTResult create_from_data(std::vector<uint8_t>&& storage) noexcept;

  //! Resets the font data to a default constructed state.
  TT_API void reset() noexcept;

  //! \}

  //! \name Accessors
  //! \{

  //! Tests whether the font data is empty (not initialized).
  TT_INLINE_NODEBUG bool is_empty() const noexcept { return _size == 0; }

  //! Tests whether the font data owns its bytes.
  TT_INLINE_NODEBUG bool owns_data() const noexcept { return !_storage.empty(); }

  TT_INLINE_NODEBUG const uint8_t* data() const noexcept { return _data; }
  TT_INLINE_NODEBUG size_t size() const noexcept { return _size; }

  //! Returns the decoded offset table (global sfnt header).
  TT_INLINE_NODEBUG const TTTableDirectory& directory() const noexcept { return _directory; }

  //! Returns all table records in directory order (including duplicates).
  TT_INLINE_NODEBUG const std::vector<TTTableRecord>& table_records() const noexcept { return _records; }

  //! \}

  //! \name Table Lookup
  //! \{

  //! Returns a table record of the given `tag` or null if there is no such table.
  //!
  //! If the directory declares the same tag multiple times, the last record is returned.
  TT_API const TTTableRecord* find_record(TTTag tag) const noexcept;

  //! Tests whether the font has a table of the given `tag`.
  TT_INLINE_NODEBUG bool has_table(TTTag tag) const noexcept { return find_record(tag) != nullptr; }

  //! Returns table data of the given `tag`, or an empty table if there is no such table.
  TT_API TTFontTableData table_data(TTTag tag) const noexcept;

  //! Calculates OpenType checksum of a table described by `record`.
  //!
  //! The checksum is a sum of big-endian 32-bit words, the last word is padded with zeros. The `checkSumAdjustment`
  //! field of 'head' table is treated as zero.
  TT_API TTResult calc_table_checksum(const TTTableRecord& record, uint32_t* check_sum_out) const noexcept;

  //! \}

private:
  TTResult _init_directory() noexcept;

  std::vector<uint8_t> _storage;
  const uint8_t* _data;
  size_t _size;

  TTTableDirectory _directory;
  std::vector<TTTableRecord> _records;
  std::unordered_map<TTTag, uint32_t> _record_index;
};

//! \}

#endif // TTKIT_CORE_FONTDATA_H_INCLUDED
