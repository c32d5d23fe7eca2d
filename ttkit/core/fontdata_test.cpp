// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttkit/core/api-build_test_p.h>
#if defined(TT_TEST)

#include <ttkit/core/fontdata.h>

#include <testing/commons/sfntbuilder.h>

#include <string.h>

// TTFontData - Tests
// ==================

namespace tt {
namespace Tests {

static constexpr TTTag kTagA = TT_MAKE_TAG('a', 'a', 'a', 'a');
static constexpr TTTag kTagB = TT_MAKE_TAG('b', 'b', 'b', 'b');

static std::vector<uint8_t> build_two_table_font(uint32_t sfnt_version = 0x00010000u) {
  return SFNTBuilder::build_font({
    { kTagA, { 1, 2, 3, 4, 5, 6, 7, 8 } },
    { kTagB, { 9, 10, 11 } }
  }, sfnt_version);
}

TEST(core_fontdata, directory) {
  std::vector<uint8_t> font = build_two_table_font();

  TTFontData font_data;
  ASSERT_SUCCESS(font_data.create_from_data(font.data(), font.size()));

  EXPECT_FALSE(font_data.is_empty());
  EXPECT_FALSE(font_data.owns_data());
  EXPECT_EQ(font_data.data(), font.data());
  EXPECT_EQ(font_data.size(), font.size());

  const TTTableDirectory& directory = font_data.directory();
  EXPECT_EQ(directory.sfnt_version, 0x00010000u);
  EXPECT_EQ(directory.num_tables, 2u);
  EXPECT_EQ(directory.search_range, 32u);
  EXPECT_EQ(directory.entry_selector, 1u);
  EXPECT_EQ(directory.range_shift, 0u);

  const std::vector<TTTableRecord>& records = font_data.table_records();
  ASSERT_EQ(records.size(), 2u);

  EXPECT_EQ(records[0].tag, kTagA);
  EXPECT_EQ(records[0].offset, 12u + 2u * 16u);
  EXPECT_EQ(records[0].length, 8u);

  EXPECT_EQ(records[1].tag, kTagB);
  EXPECT_EQ(records[1].offset, 12u + 2u * 16u + 8u);
  EXPECT_EQ(records[1].length, 3u);

  TTFontTableData table = font_data.table_data(kTagB);
  ASSERT_EQ(table.size, 3u);
  EXPECT_EQ(table.data[0], 9u);
  EXPECT_EQ(table.data[2], 11u);

  EXPECT_TRUE(font_data.has_table(kTagA));
  EXPECT_FALSE(font_data.has_table(TT_MAKE_TAG('c', 'm', 'a', 'p')));
  EXPECT_TRUE(font_data.table_data(TT_MAKE_TAG('c', 'm', 'a', 'p')).is_empty());
}

TEST(core_fontdata, owned_storage_survives_move) {
  std::vector<uint8_t> font = build_two_table_font();

  TTFontData a;
  ASSERT_SUCCESS(a.create_from_data(std::vector<uint8_t>(font)));
  EXPECT_TRUE(a.owns_data());

  TTFontData b(std::move(a));
  EXPECT_TRUE(a.is_empty());
  EXPECT_TRUE(b.owns_data());
  EXPECT_EQ(b.size(), font.size());
  EXPECT_EQ(b.table_data(kTagA).data[0], 1u);
}

TEST(core_fontdata, signatures) {
  const uint32_t accepted[] = {
    0x00010000u,
    TT_MAKE_TAG('O', 'T', 'T', 'O'),
    TT_MAKE_TAG('t', 'r', 'u', 'e'),
    TT_MAKE_TAG('t', 'y', 'p', '1')
  };

  for (uint32_t sfnt_version : accepted) {
    std::vector<uint8_t> font = build_two_table_font(sfnt_version);
    TTFontData font_data;
    EXPECT_SUCCESS(font_data.create_from_data(font.data(), font.size()));
  }

  const uint32_t rejected[] = {
    TT_MAKE_TAG('t', 't', 'c', 'f'),
    TT_MAKE_TAG('w', 'O', 'F', 'F'),
    0x00020000u,
    0xDEADBEEFu
  };

  for (uint32_t sfnt_version : rejected) {
    std::vector<uint8_t> font = build_two_table_font(sfnt_version);
    TTFontData font_data;
    EXPECT_EQ(font_data.create_from_data(font.data(), font.size()), TTResult(TT_ERROR_INVALID_SIGNATURE));
    EXPECT_TRUE(font_data.is_empty());
  }
}

TEST(core_fontdata, truncated_input) {
  std::vector<uint8_t> font = build_two_table_font();

  // Shorter than the header.
  {
    TTFontData font_data;
    EXPECT_EQ(font_data.create_from_data(font.data(), 11), TTResult(TT_ERROR_OUT_OF_BOUNDS));
  }

  // Header is complete, but table records are not.
  {
    TTFontData font_data;
    EXPECT_EQ(font_data.create_from_data(font.data(), 12u + 16u + 8u), TTResult(TT_ERROR_OUT_OF_BOUNDS));
  }

  // Table records are complete, but the last table is cut.
  {
    TTFontData font_data;
    EXPECT_EQ(font_data.create_from_data(font.data(), 12u + 2u * 16u + 8u + 2u), TTResult(TT_ERROR_OUT_OF_BOUNDS));
    EXPECT_TRUE(font_data.is_empty());
    EXPECT_TRUE(font_data.table_records().empty());
  }
}

TEST(core_fontdata, record_outside_of_data) {
  std::vector<uint8_t> font = build_two_table_font();

  // Offset of the second table record.
  SFNTBuilder::ByteWriter w;
  w.data = font;
  w.put_u32_at(12u + 16u + 8u, 0xFFFFFFF0u);

  TTFontData font_data;
  EXPECT_EQ(font_data.create_from_data(w.data.data(), w.size()), TTResult(TT_ERROR_OUT_OF_BOUNDS));
}

TEST(core_fontdata, invalid_arguments) {
  TTFontData font_data;
  EXPECT_EQ(font_data.create_from_data(nullptr, 10), TTResult(TT_ERROR_INVALID_VALUE));
  EXPECT_EQ(font_data.create_from_data(nullptr, 0), TTResult(TT_ERROR_OUT_OF_BOUNDS));
  EXPECT_EQ(font_data.create_from_file("/this/path/does/not/exist.ttf"), TTResult(TT_ERROR_NO_ENTRY));
}

TEST(core_fontdata, create_from_file) {
  std::vector<uint8_t> font = SFNTBuilder::build_minimal_font();

  SFNTBuilder::TempFile file;
  ASSERT_TRUE(file.create(font));

  TTFontData font_data;
  ASSERT_SUCCESS(font_data.create_from_file(file.path.c_str()));
  EXPECT_TRUE(font_data.owns_data());
  ASSERT_EQ(font_data.size(), font.size());
  EXPECT_EQ(memcmp(font_data.data(), font.data(), font.size()), 0);
  EXPECT_EQ(font_data.directory().num_tables, 5u);
  EXPECT_TRUE(font_data.has_table(TT_MAKE_TAG('g', 'l', 'y', 'f')));

  SFNTBuilder::TempFile empty;
  ASSERT_TRUE(empty.create({}));
  EXPECT_EQ(font_data.create_from_file(empty.path.c_str()), TTResult(TT_ERROR_FILE_EMPTY));
  EXPECT_TRUE(font_data.is_empty());
}

TEST(core_fontdata, duplicate_tags) {
  std::vector<uint8_t> font = SFNTBuilder::build_font({
    { kTagA, { 1, 1, 1, 1 } },
    { kTagB, { 2, 2, 2, 2 } },
    { kTagA, { 3, 3, 3, 3 } }
  });

  TTFontData font_data;
  ASSERT_SUCCESS(font_data.create_from_data(font.data(), font.size()));

  const std::vector<TTTableRecord>& records = font_data.table_records();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].tag, kTagA);
  EXPECT_EQ(records[1].tag, kTagB);
  EXPECT_EQ(records[2].tag, kTagA);

  // The last record of a duplicated tag wins.
  const TTTableRecord* record = font_data.find_record(kTagA);
  ASSERT_NE(record, nullptr);
  EXPECT_EQ(record->offset, records[2].offset);
  EXPECT_EQ(font_data.table_data(kTagA).data[0], 3u);
}

TEST(core_fontdata, checksums) {
  std::vector<uint8_t> head = SFNTBuilder::build_head();
  std::vector<uint8_t> font = SFNTBuilder::build_font({
    { kTagA, { 1, 2, 3, 4, 5, 6, 7, 8 } },
    { kTagB, { 9, 10, 11 } },
    { TT_MAKE_TAG('h', 'e', 'a', 'd'), head }
  });

  // Store a non-zero checkSumAdjustment, it must not contribute to the checksum of 'head'.
  SFNTBuilder::ByteWriter w;
  w.data = font;
  w.put_u32_at(12u + 3u * 16u + 8u + 4u + 8u, 0x12345678u);

  TTFontData font_data;
  ASSERT_SUCCESS(font_data.create_from_data(w.data.data(), w.size()));

  for (const TTTableRecord& record : font_data.table_records()) {
    uint32_t check_sum = 0;
    ASSERT_SUCCESS(font_data.calc_table_checksum(record, &check_sum));
    EXPECT_EQ(check_sum, record.check_sum);
  }

  // 0x01020304 + 0x05060708.
  uint32_t check_sum = 0;
  ASSERT_SUCCESS(font_data.calc_table_checksum(font_data.table_records()[0], &check_sum));
  EXPECT_EQ(check_sum, 0x06080A0Cu);

  // Trailing bytes are padded by zeros.
  ASSERT_SUCCESS(font_data.calc_table_checksum(font_data.table_records()[1], &check_sum));
  EXPECT_EQ(check_sum, 0x090A0B00u);

  TTTableRecord bad = font_data.table_records()[0];
  bad.length = uint32_t(w.size());
  EXPECT_EQ(font_data.calc_table_checksum(bad, &check_sum), TTResult(TT_ERROR_OUT_OF_BOUNDS));
  EXPECT_EQ(check_sum, 0u);
}

} // {Tests}
} // {tt}

#endif // TT_TEST
