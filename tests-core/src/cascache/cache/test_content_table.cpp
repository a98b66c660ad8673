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

#include <vector>

#include "cascache/test_common.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/content_table.hpp"
#include "cascache/cache/hash128.hpp"
#include "cascache/cache/segment_layout.hpp"

namespace cascache {
namespace cache {

DEFINE_TEST_CASE_PACKAGE(ContentTableTest, cascache.cache);

TEST(ContentTableTest, InstallAndFind) {
  TestSegmentMemory memory(10);
  ContentTable table(memory.get_segment());
  EXPECT_EQ(15U, table.get_capacity());
  EXPECT_EQ(0U, table.count_occupied());

  Hash128 fingerprint = Hash128::from_halves(7, 7);
  SlotIndex slot;
  EXPECT_FALSE(table.find(fingerprint, &slot));
  EXPECT_EQ(kErrorCodeOk, table.find_empty(fingerprint, &slot));
  EXPECT_EQ(table.get_home_slot(fingerprint), slot);
  table.install(slot, fingerprint, 520);
  EXPECT_TRUE(table.is_occupied(slot));
  EXPECT_EQ(fingerprint, table.get_fingerprint(slot));
  EXPECT_EQ(520U, table.get_address(slot));

  SlotIndex found;
  EXPECT_TRUE(table.find(fingerprint, &found));
  EXPECT_EQ(slot, found);
  table.set_address(found, 528);
  EXPECT_EQ(528U, table.get_address(found));
  EXPECT_EQ(1U, table.count_occupied());
}

TEST(ContentTableTest, Collision) {
  TestSegmentMemory memory(10);
  ContentTable table(memory.get_segment());
  Hash128 first = Hash128::from_halves(0, 2);
  Hash128 second = Hash128::from_halves(0, 17);  // same home slot
  SlotIndex slot;
  EXPECT_EQ(kErrorCodeOk, table.find_empty(first, &slot));
  table.install(slot, first, 512);
  EXPECT_EQ(kErrorCodeOk, table.find_empty(second, &slot));
  EXPECT_EQ(3U, slot);
  table.install(slot, second, 520);

  SlotIndex found;
  EXPECT_TRUE(table.find(second, &found));
  EXPECT_EQ(520U, table.get_address(found));
  EXPECT_TRUE(table.find(first, &found));
  EXPECT_EQ(512U, table.get_address(found));
}

TEST(ContentTableTest, Full) {
  TestSegmentMemory memory(3, 1.0);
  ContentTable table(memory.get_segment());
  for (uint64_t i = 1; i <= 3U; ++i) {
    SlotIndex slot;
    EXPECT_EQ(kErrorCodeOk, table.find_empty(Hash128::from_halves(0, i), &slot));
    table.install(slot, Hash128::from_halves(0, i), 512U + i * 8U);
  }
  SlotIndex slot;
  EXPECT_EQ(kErrorCodeCacheContentTableFull,
            table.find_empty(Hash128::from_halves(0, 4), &slot));
  EXPECT_TRUE(is_capacity_error(kErrorCodeCacheContentTableFull));
  EXPECT_FALSE(table.find(Hash128::from_halves(0, 4), &slot));
}

TEST(ContentTableTest, Rebuild) {
  TestSegmentMemory memory(10);
  ContentTable table(memory.get_segment());
  std::vector<ContentEntry> entries;
  entries.push_back(ContentEntry(Hash128::from_halves(0, 17), 600));
  entries.push_back(ContentEntry(Hash128::from_halves(0, 2), 520));
  entries.push_back(ContentEntry(Hash128::from_halves(5, 5), 512));

  // leftovers are wiped
  SlotIndex slot;
  EXPECT_EQ(kErrorCodeOk, table.find_empty(Hash128::from_halves(9, 9), &slot));
  table.install(slot, Hash128::from_halves(9, 9), 999);

  EXPECT_EQ(kErrorCodeOk, table.rebuild(&entries));
  EXPECT_EQ(3U, table.count_occupied());
  EXPECT_FALSE(table.find(Hash128::from_halves(9, 9), &slot));
  // inserted in ascending fingerprint order, so (0,2) takes the home slot before (0,17)
  EXPECT_TRUE(table.find(Hash128::from_halves(0, 2), &slot));
  EXPECT_EQ(2U, slot);
  EXPECT_EQ(520U, table.get_address(slot));
  EXPECT_TRUE(table.find(Hash128::from_halves(0, 17), &slot));
  EXPECT_EQ(3U, slot);
  EXPECT_EQ(600U, table.get_address(slot));

  // the same input gives the same slots
  std::vector<ContentEntry> reversed(entries.rbegin(), entries.rend());
  EXPECT_EQ(kErrorCodeOk, table.rebuild(&reversed));
  EXPECT_TRUE(table.find(Hash128::from_halves(0, 17), &slot));
  EXPECT_EQ(3U, slot);
}

TEST(ContentTableTest, ClearAll) {
  TestSegmentMemory memory(10);
  ContentTable table(memory.get_segment());
  SlotIndex slot;
  EXPECT_EQ(kErrorCodeOk, table.find_empty(Hash128::from_halves(1, 1), &slot));
  table.install(slot, Hash128::from_halves(1, 1), 512);
  table.clear_all();
  EXPECT_EQ(0U, table.count_occupied());
  EXPECT_FALSE(table.find(Hash128::from_halves(1, 1), &slot));
}

}  // namespace cache
}  // namespace cascache

TEST_MAIN_CAPTURE_SIGNALS(ContentTableTest, cascache.cache);
