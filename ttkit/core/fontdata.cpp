// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_p.h>
#include <ttkit/core/filesystem.h>
#include <ttkit/core/fontdata.h>
#include <ttkit/opentype/otcore_p.h>
#include <ttkit/support/containerops_p.h>
#include <ttkit/support/memops_p.h>

using namespace tt;
using namespace tt::OpenType;

// TTFontData - Construction & Destruction
// =======================================

TTFontData::TTFontData() noexcept
  : _data(nullptr),
    _size(0),
    _directory{} {}

TTFontData::TTFontData(TTFontData&& other) noexcept
  : _storage(std::move(other._storage)),
    _data(other._data),
    _size(other._size),
    _directory(other._directory),
    _records(std::move(other._records)),
    _record_index(std::move(other._record_index)) {
  other.reset();
}

TTFontData::~TTFontData() noexcept {}

TTFontData& TTFontData::operator=(TTFontData&& other) noexcept {
  if (this != &other) {
    _storage = std::move(other._storage);
    _data = other._data;
    _size = other._size;
    _directory = other._directory;
    _records = std::move(other._records);
    _record_index = std::move(other._record_index);
    other.reset();
  }
  return *this;
}

// TTFontData - Create
// ===================

TTResult TTFontData::create_from_file(const char* file_name) noexcept {
  reset();

  std::vector<uint8_t> storage;
  TT_PROPAGATE(TTFileSystem::read_file(file_name, storage));

  if (storage.empty())
    return tt_make_error(TT_ERROR_FILE_EMPTY);

  return create_from_data(std::move(storage));
}

TTResult TTFontData::create_from_data(const void* data, size_t size) noexcept {
  reset();

  if (TT_UNLIKELY(!data && size))
    return tt_make_error(TT_ERROR_INVALID_VALUE);

  _data = static_cast<const uint8_t*>(data);
  _size = size;

  TTResult result = _init_directory();
  if (result != TT_SUCCESS)
    reset();
  return result;
}

TTResult TTFontData::create_from_data(std::vector<uint8_t>&& storage) noexcept {
  reset();

  _storage = std::move(storage);
  _data = _storage.data();
  _size = _storage.size();

  TTResult result = _init_directory();
  if (result != TT_SUCCESS)
    reset();
  return result;
}

void TTFontData::reset() noexcept {
  std::vector<uint8_t>().swap(_storage);
  _data = nullptr;
  _size = 0;
  _directory.reset();
  _records.clear();
  _record_index.clear();
}

// TTFontData - Directory
// ======================

TTResult TTFontData::_init_directory() noexcept {
  Table<SFNTHeader> sfnt(_data, uint32_t(tt_min<size_t>(_size, 0xFFFFFFFFu)));

  if (TT_UNLIKELY(_size > 0xFFFFFFFFu))
    return tt_make_error(TT_ERROR_DATA_TOO_LARGE);

  if (TT_UNLIKELY(!sfnt.fits()))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  uint32_t version_tag = sfnt->version_tag();
  if (!SFNTHeader::is_supported_version_tag(version_tag))
    return tt_make_error(TT_ERROR_INVALID_SIGNATURE);

  // We can safely multiply `table_count` as SFNTHeader::num_tables is `UInt16`.
  uint32_t table_count = sfnt->num_tables();
  uint32_t min_data_size = uint32_t(sizeof(SFNTHeader)) + table_count * uint32_t(sizeof(SFNTHeader::TableRecord));

  if (TT_UNLIKELY(!sfnt.fits(min_data_size)))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  _directory.sfnt_version = version_tag;
  _directory.num_tables = uint16_t(table_count);
  _directory.search_range = sfnt->search_range();
  _directory.entry_selector = sfnt->entry_selector();
  _directory.range_shift = sfnt->range_shift();

  TT_PROPAGATE(ContainerOps::reserve(_records, table_count));

  const SFNTHeader::TableRecord* tables = sfnt->table_records();
  for (uint32_t table_index = 0; table_index < table_count; table_index++) {
    const SFNTHeader::TableRecord& table = tables[table_index];

    TTTableRecord record {};
    record.tag = table.tag();
    record.check_sum = table.check_sum();
    record.offset = table.offset();
    record.length = table.length();

    // Records come from an untrusted source, every table must be within the font data.
    if (TT_UNLIKELY(!sfnt.fits(record.offset, record.length)))
      return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

    TT_PROPAGATE(ContainerOps::append(_records, record));
    TT_PROPAGATE(ContainerOps::assign(_record_index, record.tag, table_index));
  }

  return TT_SUCCESS;
}

// TTFontData - Table Lookup
// =========================

const TTTableRecord* TTFontData::find_record(TTTag tag) const noexcept {
  auto it = _record_index.find(tag);
  if (it == _record_index.end())
    return nullptr;
  return &_records[it->second];
}

TTFontTableData TTFontData::table_data(TTTag tag) const noexcept {
  const TTTableRecord* record = find_record(tag);
  if (!record)
    return TTFontTableData{};

  return TTFontTableData{_data + record->offset, record->length};
}

TTResult TTFontData::calc_table_checksum(const TTTableRecord& record, uint32_t* check_sum_out) const noexcept {
  *check_sum_out = 0;

  if (TT_UNLIKELY(record.offset > _size || record.length > _size - record.offset))
    return tt_make_error(TT_ERROR_OUT_OF_BOUNDS);

  const uint8_t* p = _data + record.offset;
  uint32_t n = record.length;
  uint32_t sum = 0;

  uint32_t i = 0;
  while (n - i >= 4) {
    sum += MemOps::readU32uBE(p + i);
    i += 4;
  }

  if (i < n) {
    uint32_t tail = 0;
    for (uint32_t shift = 24; i < n; i++, shift -= 8)
      tail |= uint32_t(p[i]) << shift;
    sum += tail;
  }

  if (record.tag == TT_MAKE_TAG('h', 'e', 'a', 'd') && n >= HeadTable::kCheckSumAdjustmentOffset + 4u)
    sum -= MemOps::readU32uBE(p + HeadTable::kCheckSumAdjustmentOffset);

  *check_sum_out = sum;
  return TT_SUCCESS;
}
