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
#ifndef CASCACHE_ASSORTED_UNIFORM_RANDOM_HPP_
#define CASCACHE_ASSORTED_UNIFORM_RANDOM_HPP_

#include <stdint.h>

namespace cascache {
namespace assorted {

/**
 * @brief A very simple and deterministic random generator that is more aligned with standard
 * benchmark such as TPC-C.
 * @ingroup ASSORTED
 * @details
 * Actually this is exactly from TPC-C spec.
 * The eviction policy draws sampling slots from this generator. Each process has its own
 * instance, and testcases give a fixed seed to make the sampled slots reproducible.
 */
class UniformRandom {
 public:
  UniformRandom() : seed_(0) {}
  explicit UniformRandom(uint64_t seed) : seed_(seed) {}

  /**
   * In TPCC terminology, from=x, to=y.
   * NOTE both from and to are _inclusive_.
   * @pre from <= to && to - from < 0xFFFFFFFF
   */
  uint32_t uniform_within(uint32_t from, uint32_t to) {
    return from + (next_uint32() % (to - from + 1));
  }

  uint32_t next_uint32() {
    seed_ = seed_ * 0xD04C3175 + 0x53DA9022;
    return (seed_ >> 32) ^ (seed_ & 0xFFFFFFFF);
  }

  uint64_t get_current_seed() const {
    return seed_;
  }
  void set_current_seed(uint64_t seed) {
    seed_ = seed;
  }

 private:
  uint64_t seed_;
};

}  // namespace assorted
}  // namespace cascache

#endif  // CASCACHE_ASSORTED_UNIFORM_RANDOM_HPP_
