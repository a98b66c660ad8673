/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include <stdint.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "cascache/test_common.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/segment_layout.hpp"

namespace cascache {
namespace cache {

DEFINE_TEST_CASE_PACKAGE(SegmentLayoutTest, cascache.cache);

TEST(SegmentLayoutTest, Geometry) {
  SegmentGeometry geometry;
  EXPECT_EQ(kErrorCodeOk, SegmentGeometry::compute(100, 0.65, 200, 2000, &geometry));
  EXPECT_EQ(100U, geometry.max_items_);
  EXPECT_EQ(153U, geometry.key_table_capacity_);  // floor(100 / 0.65)
  EXPECT_EQ(153U, geometry.content_table_capacity_);
  EXPECT_EQ(kHeaderSize, geometry.pool_start_);
  // align8(5 + 200) + align8(5 + 2000) per item
  EXPECT_EQ(100U * (208U + 2008U), geometry.pool_size_);
  EXPECT_EQ(geometry.pool_start_ + geometry.pool_size_, geometry.key_table_start_);
  EXPECT_EQ(geometry.key_table_start_ + 153U * kKeyEntrySize, geometry.content_table_start_);
  EXPECT_EQ(geometry.content_table_start_ + 153U * kContentEntrySize, geometry.total_size_);
}

TEST(SegmentLayoutTest, FullLoadFactor) {
  SegmentGeometry geometry;
  EXPECT_EQ(kErrorCodeOk, SegmentGeometry::compute(3, 1.0, 8, 8, &geometry));
  EXPECT_EQ(3U, geometry.key_table_capacity_);
  EXPECT_EQ(3U, geometry.max_items_);
}

TEST(SegmentLayoutTest, InvalidParameters) {
  SegmentGeometry geometry;
  EXPECT_EQ(kErrorCodeCacheInvalidMaxsize, SegmentGeometry::compute(0, 0.65, 8, 8, &geometry));
  EXPECT_EQ(kErrorCodeCacheInvalidLoadFactor,
            SegmentGeometry::compute(10, 0.0, 8, 8, &geometry));
  EXPECT_EQ(kErrorCodeCacheInvalidLoadFactor,
            SegmentGeometry::compute(10, 1.5, 8, 8, &geometry));
  EXPECT_EQ(kErrorCodeCacheInvalidLoadFactor,
            SegmentGeometry::compute(10, -0.5, 8, 8, &geometry));
  EXPECT_EQ(kErrorCodeCacheInvalidLoadFactor,
    SegmentGeometry::compute(10, std::numeric_limits<double>::quiet_NaN(), 8, 8, &geometry));
  EXPECT_EQ(kErrorCodeCacheTooManySlots,
            SegmentGeometry::compute(kMaxSlots + 1U, 1.0, 8, 8, &geometry));
  EXPECT_EQ(kErrorCodeCacheTooManySlots,
            SegmentGeometry::compute(kMaxSlots, 0.5, 8, 8, &geometry));
  EXPECT_EQ(kErrorCodeCacheSegmentTooLarge,
            SegmentGeometry::compute(0x7FFFFFFFULL, 1.0, 0xFFFFFFF0U, 0xFFFFFFF0U, &geometry));
  EXPECT_EQ(kErrorCodeCacheSegmentTooLarge, SegmentGeometry::compute(
    kMaxSlots, 1.0, 0xFFFFFFFFU, 0xFFFFFFFFU, &geometry));
  EXPECT_TRUE(is_configuration_error(kErrorCodeCacheSegmentTooLarge));
}

TEST(SegmentLayoutTest, LargeAverageSizes) {
  // header plus a value close to 4GB must not wrap around 32 bits
  SegmentGeometry geometry;
  EXPECT_EQ(kErrorCodeOk, SegmentGeometry::compute(10, 0.65, 200, 0xFFFFFFFCU, &geometry));
  EXPECT_GE(geometry.pool_size_, 10ULL * 0xFFFFFFFCULL);
  EXPECT_EQ(geometry.pool_start_ + geometry.pool_size_, geometry.key_table_start_);
  EXPECT_GT(geometry.total_size_, geometry.key_table_start_);
  EXPECT_GT(geometry.content_table_start_, geometry.key_table_start_);
}

TEST(SegmentLayoutTest, FormatAndValidate) {
  TestSegmentMemory memory(10);
  SegmentView* segment = memory.get_segment();
  EXPECT_EQ(kErrorCodeOk, segment->validate());
  EXPECT_EQ(kMagic, segment->get_magic());
  EXPECT_EQ(kFormatVersion, segment->get_format_version());
  EXPECT_EQ(0U, segment->get_segment_version());
  EXPECT_EQ(0U, segment->get_pool_used());
  EXPECT_EQ(segment->get_pool_start(), segment->get_pool_next());
  EXPECT_EQ(0U, segment->get_item_count());
  EXPECT_EQ(10U, segment->get_max_items());

  SegmentGeometry geometry = segment->get_geometry();
  EXPECT_EQ(memory.get_geometry().total_size_, geometry.total_size_);
  EXPECT_EQ(memory.get_geometry().key_table_capacity_, geometry.key_table_capacity_);

  // the header is big-endian at fixed offsets
  const char* header = segment->bytes(0, kHeaderSize);
  EXPECT_EQ(0x4A, static_cast<uint8_t>(header[0]));
  EXPECT_EQ(0xB8, static_cast<uint8_t>(header[1]));
  EXPECT_EQ(0x00, static_cast<uint8_t>(header[6]));
  EXPECT_EQ(0x01, static_cast<uint8_t>(header[7]));
  EXPECT_EQ(0x02, static_cast<uint8_t>(header[kHeaderOffsetPoolStart + 6]));  // 512
  for (uint64_t i = kHeaderOffsetMisses + 8U; i < kHeaderSize; ++i) {
    EXPECT_EQ(0, header[i]);
  }
}

TEST(SegmentLayoutTest, CorruptedMagic) {
  TestSegmentMemory memory(10);
  SegmentView* segment = memory.get_segment();
  segment->write_u8(2, segment->read_u8(2) ^ 0x10);
  EXPECT_EQ(kErrorCodeCacheInvalidMagic, segment->validate());
  EXPECT_TRUE(is_configuration_error(segment->validate()));
}

TEST(SegmentLayoutTest, VersionMismatch) {
  TestSegmentMemory memory(10);
  SegmentView* segment = memory.get_segment();
  segment->write_u64(kHeaderOffsetMagic, kMagicBase | 2U);
  EXPECT_EQ(kErrorCodeCacheVersionMismatch, segment->validate());
  EXPECT_TRUE(is_configuration_error(segment->validate()));
}

TEST(SegmentLayoutTest, CorruptHeader) {
  TestSegmentMemory memory(10);
  SegmentView* segment = memory.get_segment();
  segment->write_u64(kHeaderOffsetKeyTableCapacity, segment->get_key_table_capacity() + 1U);
  EXPECT_EQ(kErrorCodeCacheCorruptHeader, segment->validate());

  TestSegmentMemory memory2(10);
  SegmentView* segment2 = memory2.get_segment();
  segment2->set_pool_used(8);  // next is not start + used
  EXPECT_EQ(kErrorCodeCacheCorruptHeader, segment2->validate());

  SegmentView null_view;
  EXPECT_EQ(kErrorCodeCacheCorruptHeader, null_view.validate());
}

TEST(SegmentLayoutTest, UnformattedIsInvalid) {
  std::vector<char> buffer(4096, 0);
  SegmentView segment(&buffer[0], buffer.size());
  EXPECT_EQ(kErrorCodeCacheInvalidMagic, segment.validate());
}

TEST(SegmentLayoutTest, EntryOffsets) {
  TestSegmentMemory memory(10);
  SegmentView* segment = memory.get_segment();
  EXPECT_EQ(segment->get_key_table_start(), segment->key_entry_offset(0));
  EXPECT_EQ(segment->get_key_table_start() + 3U * kKeyEntrySize, segment->key_entry_offset(3));
  EXPECT_EQ(segment->get_content_table_start() + 2U * kContentEntrySize,
            segment->content_entry_offset(2));
  EXPECT_TRUE(segment->contains_range(0, segment->get_total_size()));
  EXPECT_FALSE(segment->contains_range(segment->get_total_size(), 1));
}

TEST(SegmentLayoutTest, Counters) {
  TestSegmentMemory memory(10);
  SegmentView* segment = memory.get_segment();
  segment->increment_hits();
  segment->increment_hits();
  segment->increment_misses();
  segment->bump_segment_version();
  EXPECT_EQ(2U, segment->get_hits());
  EXPECT_EQ(1U, segment->get_misses());
  EXPECT_EQ(1U, segment->get_segment_version());
  EXPECT_EQ(kErrorCodeOk, segment->validate());
}

}  // namespace cache
}  // namespace cascache

TEST_MAIN_CAPTURE_SIGNALS(SegmentLayoutTest, cascache.cache);
