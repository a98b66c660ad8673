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

#include <string>

#include "cascache/test_common.hpp"
#include "cascache/cache/blob_pool.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/segment_layout.hpp"

namespace cascache {
namespace cache {

DEFINE_TEST_CASE_PACKAGE(BlobPoolTest, cascache.cache);

TEST(BlobPoolTest, RecordSize) {
  EXPECT_EQ(8U, BlobPool::get_record_size(0));
  EXPECT_EQ(8U, BlobPool::get_record_size(3));
  EXPECT_EQ(16U, BlobPool::get_record_size(4));
  EXPECT_EQ(16U, BlobPool::get_record_size(11));
  EXPECT_EQ(24U, BlobPool::get_record_size(12));
}

TEST(BlobPoolTest, AllocateAndRead) {
  TestSegmentMemory memory(4);  // 4 * (24 + 72) bytes of pool
  SegmentView* segment = memory.get_segment();
  BlobPool pool(segment);
  EXPECT_EQ(kHeaderSize, pool.get_start());
  EXPECT_EQ(384U, pool.get_size());
  EXPECT_EQ(0U, pool.get_used());

  std::string key("abc");
  BlobAddress key_address;
  EXPECT_EQ(kErrorCodeOk, pool.allocate(kBlobTagKey, key.data(), key.size(), &key_address));
  EXPECT_EQ(kHeaderSize, key_address);
  EXPECT_EQ(8U, pool.get_used());

  std::string value("0123456789AB");
  BlobAddress value_address;
  EXPECT_EQ(kErrorCodeOk,
    pool.allocate(kBlobTagContent, value.data(), value.size(), &value_address));
  EXPECT_EQ(kHeaderSize + 8U, value_address);
  EXPECT_EQ(32U, pool.get_used());
  EXPECT_EQ(pool.get_start() + pool.get_used(), pool.get_next());
  EXPECT_EQ(kErrorCodeOk, segment->validate());

  // tag(1) + big-endian length(4) + data, zero padded
  EXPECT_EQ(kBlobTagKey, segment->read_u8(key_address));
  EXPECT_EQ(0, segment->bytes(key_address + 1U, 4)[0]);
  EXPECT_EQ(3, segment->bytes(key_address + 1U, 4)[3]);
  EXPECT_EQ('a', segment->bytes(key_address + 5U, 1)[0]);

  std::string out;
  EXPECT_EQ(kErrorCodeOk, pool.read(key_address, kBlobTagKey, &out));
  EXPECT_EQ(key, out);
  EXPECT_EQ(kErrorCodeOk, pool.read(value_address, kBlobTagContent, &out));
  EXPECT_EQ(value, out);

  bool same = false;
  EXPECT_EQ(kErrorCodeOk, pool.equals(key_address, kBlobTagKey, "abc", 3, &same));
  EXPECT_TRUE(same);
  EXPECT_EQ(kErrorCodeOk, pool.equals(key_address, kBlobTagKey, "abd", 3, &same));
  EXPECT_FALSE(same);
  EXPECT_EQ(kErrorCodeOk, pool.equals(key_address, kBlobTagKey, "ab", 2, &same));
  EXPECT_FALSE(same);
}

TEST(BlobPoolTest, EmptyBlob) {
  TestSegmentMemory memory(4);
  BlobPool pool(memory.get_segment());
  BlobAddress address;
  EXPECT_EQ(kErrorCodeOk, pool.allocate(kBlobTagContent, "", 0, &address));
  EXPECT_EQ(8U, pool.get_used());
  std::string out("garbage");
  EXPECT_EQ(kErrorCodeOk, pool.read(address, kBlobTagContent, &out));
  EXPECT_EQ(std::string(), out);
}

TEST(BlobPoolTest, Full) {
  TestSegmentMemory memory(1, 1.0, 8, 8);  // 16 + 16 bytes of pool
  BlobPool pool(memory.get_segment());
  EXPECT_EQ(32U, pool.get_size());
  BlobAddress address;
  std::string data(20, 'x');
  EXPECT_EQ(kErrorCodeOk, pool.allocate(kBlobTagKey, data.data(), data.size(), &address));
  EXPECT_EQ(32U, pool.get_used());
  EXPECT_EQ(0U, pool.get_free());
  EXPECT_FALSE(pool.has_room_for(8));
  EXPECT_EQ(kErrorCodeCachePoolFull, pool.allocate(kBlobTagKey, "a", 1, &address));
  EXPECT_TRUE(is_capacity_error(kErrorCodeCachePoolFull));
  EXPECT_EQ(32U, pool.get_used());
}

TEST(BlobPoolTest, InspectRejectsBadAddresses) {
  TestSegmentMemory memory(4);
  SegmentView* segment = memory.get_segment();
  BlobPool pool(segment);
  BlobAddress address;
  EXPECT_EQ(kErrorCodeOk, pool.allocate(kBlobTagKey, "hello", 5, &address));

  BlobRecord record;
  EXPECT_EQ(kErrorCodeOk, pool.inspect(address, &record));
  EXPECT_EQ(address, record.address_);
  EXPECT_EQ(kBlobTagKey, record.tag_);
  EXPECT_EQ(5U, record.length_);
  EXPECT_EQ(16U, record.get_record_size());

  EXPECT_EQ(kErrorCodeCacheCorruptBlob, pool.inspect(address + 1U, &record));  // misaligned
  EXPECT_EQ(kErrorCodeCacheCorruptBlob, pool.inspect(address + 16U, &record));  // beyond next
  EXPECT_EQ(kErrorCodeCacheCorruptBlob, pool.inspect(0, &record));  // in the header

  std::string out;
  EXPECT_EQ(kErrorCodeCacheCorruptBlob, pool.read(address, kBlobTagContent, &out));  // tag

  // length pointing beyond the allocated region
  segment->write_u32(address + 1U, 1000);
  EXPECT_EQ(kErrorCodeCacheCorruptBlob, pool.inspect(address, &record));
  segment->write_u32(address + 1U, 5);
  segment->write_u8(address, 7);  // unknown tag
  EXPECT_EQ(kErrorCodeCacheCorruptBlob, pool.inspect(address, &record));
}

TEST(BlobPoolTest, TruncateAndReset) {
  TestSegmentMemory memory(4);
  SegmentView* segment = memory.get_segment();
  BlobPool pool(segment);
  BlobAddress first;
  BlobAddress second;
  EXPECT_EQ(kErrorCodeOk, pool.allocate(kBlobTagKey, "first", 5, &first));
  EXPECT_EQ(kErrorCodeOk, pool.allocate(kBlobTagKey, "second", 6, &second));
  EXPECT_EQ(32U, pool.get_used());

  pool.truncate(second);
  EXPECT_EQ(16U, pool.get_used());
  EXPECT_EQ(second, pool.get_next());
  for (uint64_t i = 0; i < 16U; ++i) {
    EXPECT_EQ(0, segment->read_u8(second + i));
  }
  std::string out;
  EXPECT_EQ(kErrorCodeOk, pool.read(first, kBlobTagKey, &out));
  EXPECT_EQ(std::string("first"), out);

  pool.reset();
  EXPECT_EQ(0U, pool.get_used());
  EXPECT_EQ(pool.get_start(), pool.get_next());
  EXPECT_EQ(0, segment->read_u8(first));
  EXPECT_EQ(kErrorCodeOk, segment->validate());
}

}  // namespace cache
}  // namespace cascache

TEST_MAIN_CAPTURE_SIGNALS(BlobPoolTest, cascache.cache);
