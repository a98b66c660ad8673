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
#include <gtest/gtest.h>

#include <stdint.h>

#include <set>
#include <sstream>
#include <string>

#include "cascache/test_common.hpp"
#include "cascache/assorted/assorted_func.hpp"
#include "cascache/assorted/uniform_random.hpp"

namespace cascache {
namespace assorted {

DEFINE_TEST_CASE_PACKAGE(AssortedTest, cascache.assorted);

uint64_t align_4kb(uint64_t value) { return align< uint64_t, (1U << 12) >(value); }

TEST(AssortedTest, Align8) {
  EXPECT_EQ(0U, align8<uint64_t>(0));
  EXPECT_EQ(8U, align8<uint64_t>(1));
  EXPECT_EQ(8U, align8<uint64_t>(8));
  EXPECT_EQ(16U, align8<uint64_t>(9));
  EXPECT_EQ(8U, align8<uint64_t>(5U + 3U));  // blob of 3 bytes
  EXPECT_EQ(16U, align8<uint64_t>(5U + 4U));
  const uint64_t kBigNumber = (1ULL << 32);
  EXPECT_EQ(kBigNumber + 8U, align8<uint64_t>(kBigNumber + 1U));
}

TEST(AssortedTest, Align4kb) {
  EXPECT_EQ(4U << 10, align_4kb((4U << 10)));
  EXPECT_EQ(8U << 10, align_4kb((4U << 10) + 42));
  EXPECT_EQ(8U << 10, align_4kb((8U << 10) - 1U));
}

TEST(AssortedTest, Hex) {
  std::stringstream str;
  str << Hex(255) << " " << Hex(10, 4);
  EXPECT_EQ(std::string("0xFF 0x000A"), str.str());
}

TEST(AssortedTest, HexString) {
  std::string data("key");
  std::stringstream str;
  str << HexString(data);
  EXPECT_EQ(std::string("0x6B6579 (3 bytes)"), str.str());

  std::string longer(10, 'a');
  std::stringstream str2;
  str2 << HexString(longer, 2);
  EXPECT_EQ(std::string("0x6161 ...(8 more bytes)"), str2.str());
}

TEST(AssortedTest, OsError) {
  EXPECT_EQ(std::string("[No Error]"), os_error(0));
  EXPECT_NE(std::string::npos, os_error(2).find("[Errno 2]"));
}

TEST(AssortedTest, UniformRandomDeterministic) {
  UniformRandom rnd1(1234L);
  UniformRandom rnd2(1234L);
  for (int i = 0; i < 1000; ++i) {
    EXPECT_EQ(rnd1.next_uint32(), rnd2.next_uint32());
  }
  EXPECT_EQ(rnd1.get_current_seed(), rnd2.get_current_seed());
}

TEST(AssortedTest, UniformRandomWithin) {
  UniformRandom rnd(42L);
  std::set<uint32_t> seen;
  for (int i = 0; i < 1000; ++i) {
    uint32_t value = rnd.uniform_within(3, 9);
    EXPECT_GE(value, 3U);
    EXPECT_LE(value, 9U);
    seen.insert(value);
  }
  EXPECT_EQ(7U, seen.size());
}

}  // namespace assorted
}  // namespace cascache

TEST_MAIN_CAPTURE_SIGNALS(AssortedTest, cascache.assorted);
