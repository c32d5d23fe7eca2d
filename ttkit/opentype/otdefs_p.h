// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTKIT_OPENTYPE_OTDEFS_P_H_INCLUDED
#define TTKIT_OPENTYPE_OTDEFS_P_H_INCLUDED

#include <ttkit/core/api-internal_p.h>
#include <ttkit/core/fontdefs.h>
#include <ttkit/support/memops_p.h>

//! \cond INTERNAL
//! \addtogroup tt_opentype_impl
//! \{

//! \namespace tt::OpenType
//! Low-level OpenType functionality, not exposed to users directly.

namespace tt::OpenType {

struct OTFontImpl;
struct OTFaceTables;

template<typename T>
struct Table;

//! A read only data that represents a font table or its sub-table.
//!
//! All `read_xxx()` functions are bounds-checked reads at an explicit offset relative to `data`. They never mutate
//! the table, so the same table can be read by multiple decoders in any order. A read that would cross `size` fails
//! with \ref TT_ERROR_OUT_OF_BOUNDS.
struct RawTable {
  //! \name Members
  //! \{

  //! Pointer to the beginning of the data interpreted as `uint8_t*`.
  const uint8_t* data;
  //! Size of `data` in bytes.
  uint32_t size;

  //! \}

  //! \name Construction & Destruction
  //! \{

  TT_INLINE_NODEBUG RawTable() noexcept = default;
  TT_INLINE_NODEBUG RawTable(const RawTable& other) noexcept = default;

  TT_INLINE_NODEBUG RawTable(const uint8_t* data, uint32_t size) noexcept
    : data(data),
      size(size) {}

  //! \}

  //! \name Overloaded Operators
  //! \{

  //! Tests whether the table has a content.
  //!
  //! \note This is essentially the opposite of `is_empty()`.
  TT_INLINE_NODEBUG explicit operator bool() const noexcept { return size != 0; }

  TT_INLINE_NODEBUG RawTable& operator=(const RawTable& other) noexcept = default;

  //! \}

  //! \name Common Functionality
  //! \{

  //! Tests whether the table is empty (has no content).
  TT_INLINE_NODEBUG bool is_empty() const noexcept { return !size; }

  TT_INLINE_NODEBUG void reset() noexcept {
    data = nullptr;
    size = 0;
  }

  TT_INLINE_NODEBUG void reset(const uint8_t* data_, uint32_t size_) noexcept {
    data = data_;
    size = size_;
  }

  template<typename SizeT>
  TT_INLINE_NODEBUG bool fits(const SizeT& n_bytes) const noexcept { return n_bytes <= size; }

  //! Tests whether `n_bytes` starting at `offset` are within the table.
  TT_INLINE_NODEBUG bool fits(size_t offset, size_t n_bytes) const noexcept {
    return offset <= size && n_bytes <= size_t(size) - offset;
  }

  //! \}

  //! \name Checked Reads
  //! \{

  TT_INLINE TTResult read_u8(size_t offset, uint32_t& out) const noexcept {
    if (TT_UNLIKELY(!fits(offset, 1)))
      return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);
    out = MemOps::readU8(data + offset);
    return TT_SUCCESS;
  }

  TT_INLINE TTResult read_u16(size_t offset, uint32_t& out) const noexcept {
    if (TT_UNLIKELY(!fits(offset, 2)))
      return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);
    out = MemOps::readU16uBE(data + offset);
    return TT_SUCCESS;
  }

  TT_INLINE TTResult read_i16(size_t offset, int32_t& out) const noexcept {
    if (TT_UNLIKELY(!fits(offset, 2)))
      return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);
    out = MemOps::readI16uBE(data + offset);
    return TT_SUCCESS;
  }

  TT_INLINE TTResult read_u32(size_t offset, uint32_t& out) const noexcept {
    if (TT_UNLIKELY(!fits(offset, 4)))
      return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);
    out = MemOps::readU32uBE(data + offset);
    return TT_SUCCESS;
  }

  //! \}

  //! \name Accessors
  //! \{

  template<typename T>
  TT_INLINE const T* data_as(size_t offset = 0u) const noexcept {
    return reinterpret_cast<const T*>(data + offset);
  }

  //! Returns a sub-table starting at `offset` and spanning the rest of this table (clamped).
  TT_INLINE RawTable sub_table(uint32_t offset) const noexcept {
    offset = tt_min(offset, size);
    return RawTable(data + offset, size - offset);
  }

  template<typename T>
  TT_INLINE Table<T> sub_table(uint32_t offset) const noexcept;

  //! Returns a sub-table of `n_bytes` starting at `offset`, fails if the range is not within this table.
  TT_INLINE TTResult sub_table_checked(uint32_t offset, uint32_t n_bytes, RawTable& out) const noexcept {
    if (TT_UNLIKELY(!fits(offset, n_bytes)))
      return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);
    out.reset(data + offset, n_bytes);
    return TT_SUCCESS;
  }

  //! \}
};

//! A convenience class that maps `RawTable` to a typed table.
template<typename T>
struct Table : public RawTable {
  //! \name Construction & Destruction
  //! \{

  TT_INLINE_NODEBUG Table() noexcept = default;
  TT_INLINE_NODEBUG Table(const Table& other) noexcept = default;

  TT_INLINE_NODEBUG Table(const RawTable& other) noexcept
    : RawTable(other.data, other.size) {}

  TT_INLINE_NODEBUG Table(const uint8_t* data, uint32_t size) noexcept
    : RawTable(data, size) {}

  //! \}

  //! \name Overloaded Operators
  //! \{

  TT_INLINE_NODEBUG Table& operator=(const Table& other) noexcept = default;
  TT_INLINE_NODEBUG const T* operator->() const noexcept { return data_as<T>(); }

  //! \}

  //! \name Helpers
  //! \{

  using RawTable::fits;

  TT_INLINE_NODEBUG bool fits() const noexcept { return size >= T::kBaseSize; }

  //! \}
};

template<typename T>
TT_INLINE Table<T> RawTable::sub_table(uint32_t offset) const noexcept {
  offset = tt_min(offset, size);
  return Table<T>(data + offset, size - offset);
}

//! Big-endian data type used by fixed layout table structs (only valid after `Table<T>::fits()` succeeded).
#pragma pack(push, 1)
template<typename T, size_t Size>
struct DataType {
  uint8_t data[Size];

  TT_INLINE_NODEBUG T value() const noexcept {
    if constexpr (Size == 1)
      return T(MemOps::readU8(data));
    else if constexpr (Size == 2)
      return T(MemOps::readU16uBE(data));
    else if constexpr (Size == 4)
      return T(MemOps::readU32uBE(data));
    else
      return T((uint64_t(MemOps::readU32uBE(data)) << 32) | uint64_t(MemOps::readU32uBE(data + 4)));
  }

  TT_INLINE_NODEBUG T operator()() const noexcept { return value(); }
};
#pragma pack(pop)

// Everything in OpenType is big-endian.
typedef DataType<int8_t  , 1> Int8;
typedef DataType<int16_t , 2> Int16;
typedef DataType<int32_t , 4> Int32;
typedef DataType<int64_t , 8> Int64;

typedef DataType<uint8_t , 1> UInt8;
typedef DataType<uint16_t, 2> UInt16;
typedef DataType<uint32_t, 4> UInt32;
typedef DataType<uint64_t, 8> UInt64;

typedef UInt16 Offset16;
typedef UInt32 Offset32;

typedef Int16 FWord;
typedef UInt32 F16x16;
typedef UInt32 CheckSum;
typedef Int64 DateTime;

} // {tt::OpenType}

//! \}
//! \endcond

#endif // TTKIT_OPENTYPE_OTDEFS_P_H_INCLUDED
