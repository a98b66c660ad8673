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
#include "cascache/cache/hash128.hpp"
#include "cascache/cache/key_table.hpp"
#include "cascache/cache/segment_layout.hpp"

namespace cascache {
namespace cache {

DEFINE_TEST_CASE_PACKAGE(KeyTableTest, cascache.cache);

/** Key table of 15 slots (maxsize 10) with helpers to insert keys of chosen hashes. */
struct KeyTableFixture {
  KeyTableFixture() : memory_(10), pool_(memory_.get_segment()),
    table_(memory_.get_segment(), &pool_) {}

  SlotIndex insert(const std::string& key, uint64_t hash_low, uint64_t timestamp = 1) {
    Hash128 hash = Hash128::from_halves(0, hash_low);
    BlobAddress address;
    COERCE_ERROR_CODE(pool_.allocate(kBlobTagKey, key.data(), key.size(), &address));
    SlotIndex slot;
    COERCE_ERROR_CODE(table_.find_empty_or_tombstone(hash, &slot));
    table_.install(slot, hash, address, Hash128::from_halves(1, hash_low), timestamp);
    return slot;
  }
  ErrorCode find(const std::string& key, uint64_t hash_low, SlotIndex* slot) {
    return table_.find(Hash128::from_halves(0, hash_low), key.data(), key.size(), slot);
  }

  TestSegmentMemory memory_;
  BlobPool          pool_;
  KeyTable          table_;
};

TEST(KeyTableTest, Empty) {
  KeyTableFixture fixture;
  KeyTable& table = fixture.table_;
  EXPECT_EQ(15U, table.get_capacity());
  EXPECT_EQ(10U, table.get_max_items());
  EXPECT_EQ(0U, table.get_item_count());
  for (SlotIndex slot = 0; slot < table.get_capacity(); ++slot) {
    EXPECT_EQ(kKeySlotEmpty, table.get_state(slot));
  }
  SlotIndex slot;
  EXPECT_EQ(kErrorCodeCacheKeyNotFound, fixture.find("a", 3, &slot));
}

TEST(KeyTableTest, InsertAndFind) {
  KeyTableFixture fixture;
  KeyTable& table = fixture.table_;
  SlotIndex a = fixture.insert("a", 3, 100);
  EXPECT_EQ(3U, a);  // home slot is hash mod capacity
  EXPECT_EQ(kKeySlotOccupied, table.get_state(a));
  EXPECT_EQ(1U, table.get_item_count());
  EXPECT_EQ(Hash128::from_halves(0, 3), table.get_hash(a));
  EXPECT_EQ(Hash128::from_halves(1, 3), table.get_fingerprint(a));
  EXPECT_EQ(100U, table.get_timestamp(a));

  SlotIndex found;
  EXPECT_EQ(kErrorCodeOk, fixture.find("a", 3, &found));
  EXPECT_EQ(a, found);

  table.touch(a, 200);
  EXPECT_EQ(200U, table.get_timestamp(a));
  table.set_fingerprint(a, Hash128::from_halves(9, 9));
  EXPECT_EQ(Hash128::from_halves(9, 9), table.get_fingerprint(a));
}

TEST(KeyTableTest, LinearProbing) {
  KeyTableFixture fixture;
  SlotIndex a = fixture.insert("a", 14);
  SlotIndex b = fixture.insert("b", 14 + 15);  // same home slot, wraps around
  EXPECT_EQ(14U, a);
  EXPECT_EQ(0U, b);
  SlotIndex found;
  EXPECT_EQ(kErrorCodeOk, fixture.find("b", 14 + 15, &found));
  EXPECT_EQ(b, found);
}

TEST(KeyTableTest, SameHashDifferentKey) {
  KeyTableFixture fixture;
  SlotIndex x = fixture.insert("x", 5);
  SlotIndex y = fixture.insert("y", 5);
  EXPECT_NE(x, y);
  SlotIndex found;
  EXPECT_EQ(kErrorCodeOk, fixture.find("x", 5, &found));
  EXPECT_EQ(x, found);
  EXPECT_EQ(kErrorCodeOk, fixture.find("y", 5, &found));
  EXPECT_EQ(y, found);
  EXPECT_EQ(kErrorCodeCacheKeyNotFound, fixture.find("z", 5, &found));
}

TEST(KeyTableTest, TombstoneKeepsProbeChain) {
  KeyTableFixture fixture;
  KeyTable& table = fixture.table_;
  SlotIndex a = fixture.insert("a", 3);
  SlotIndex b = fixture.insert("b", 18);  // home slot 3, placed after a
  EXPECT_EQ(3U, a);
  EXPECT_EQ(4U, b);
  EXPECT_EQ(2U, table.get_item_count());

  table.tombstone(a);
  EXPECT_EQ(kKeySlotTombstone, table.get_state(a));
  EXPECT_TRUE(table.get_hash(a).is_all_ones());
  EXPECT_EQ(0U, table.get_key_address(a));
  EXPECT_TRUE(table.get_fingerprint(a).is_zero());
  EXPECT_EQ(0U, table.get_timestamp(a));
  EXPECT_EQ(1U, table.get_item_count());

  SlotIndex found;
  EXPECT_EQ(kErrorCodeCacheKeyNotFound, fixture.find("a", 3, &found));
  EXPECT_EQ(kErrorCodeOk, fixture.find("b", 18, &found));
  EXPECT_EQ(b, found);

  // the tombstone is reused
  SlotIndex c = fixture.insert("c", 33);
  EXPECT_EQ(a, c);
  EXPECT_EQ(kErrorCodeOk, fixture.find("b", 18, &found));
  EXPECT_EQ(b, found);
  EXPECT_EQ(0U, table.count_tombstones());
  EXPECT_EQ(2U, table.get_item_count());
}

TEST(KeyTableTest, Full) {
  KeyTableFixture fixture;
  KeyTable& table = fixture.table_;
  for (uint64_t i = 0; i < table.get_capacity(); ++i) {
    fixture.insert(std::string(1, static_cast<char>('a' + i)), i + 1U);
  }
  EXPECT_EQ(table.get_capacity(), table.count_occupied());
  SlotIndex slot;
  EXPECT_EQ(kErrorCodeCacheKeyTableFull,
            table.find_empty_or_tombstone(Hash128::from_halves(0, 100), &slot));
  // a probe over a full table without the key terminates
  EXPECT_EQ(kErrorCodeCacheKeyNotFound, fixture.find("zz", 100, &slot));
}

TEST(KeyTableTest, ClearAll) {
  KeyTableFixture fixture;
  KeyTable& table = fixture.table_;
  SlotIndex a = fixture.insert("a", 3);
  fixture.insert("b", 4);
  table.tombstone(a);
  table.clear_all();
  EXPECT_EQ(0U, table.get_item_count());
  EXPECT_EQ(0U, table.count_occupied());
  EXPECT_EQ(0U, table.count_tombstones());
}

TEST(KeyTableTest, BrokenKeyBlob) {
  KeyTableFixture fixture;
  KeyTable& table = fixture.table_;
  SlotIndex a = fixture.insert("a", 3);
  table.set_key_address(a, kHeaderSize + 3U);  // misaligned
  SlotIndex found;
  EXPECT_EQ(kErrorCodeCacheCorruptBlob, fixture.find("a", 3, &found));
}

}  // namespace cache
}  // namespace cascache

TEST_MAIN_CAPTURE_SIGNALS(KeyTableTest, cascache.cache);
