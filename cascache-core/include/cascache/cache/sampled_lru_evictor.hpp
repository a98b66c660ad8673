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
#ifndef CASCACHE_CACHE_SAMPLED_LRU_EVICTOR_HPP_
#define CASCACHE_CACHE_SAMPLED_LRU_EVICTOR_HPP_

#include <stdint.h>

#include <vector>

#include "cascache/cxx11.hpp"
#include "cascache/assorted/uniform_random.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/fwd.hpp"

namespace cascache {
namespace cache {

/**
 * @brief Approximate LRU eviction by random sampling of the key table.
 * @ingroup CACHE
 * @details
 * @par Algorithm
 * Draws up to 2 * samples / load_factor \e distinct random slots. Empty and tombstone slots
 * are skipped. Drawing stops once \e samples occupied slots are found or the draws run out.
 * The occupied slot with the smallest last-access timestamp is tombstoned.
 * If no occupied slot is found, nothing happens.
 *
 * The load factor here is the one of the segment, max items / key table capacity, so every
 * attached process draws the same number of slots regardless of its own options.
 *
 * This bounds the cost of an eviction independently from the table size, at the cost of not
 * always choosing the true least-recently-used item. Redis does the same.
 *
 * @par Random Source
 * The random generator is given by the caller, so testcases can give a fixed seed.
 */
class SampledLruEvictor {
 public:
  SampledLruEvictor(KeyTable* table, assorted::UniformRandom* random, uint16_t samples)
    : table_(table), random_(random), samples_(samples) {}

  /** Number of slots drawn at most per eviction. Never more than the capacity. */
  uint64_t  get_max_draws() const;

  /**
   * @brief Chooses the slot to evict without modifying anything.
   * @param[out] victim the occupied slot with the oldest timestamp among the sampled ones
   * @return whether any occupied slot was sampled
   */
  bool      choose_victim(SlotIndex* victim);

  /**
   * @brief Chooses a victim and tombstones it.
   * @param[out] victim if not null, receives the evicted slot
   * @return whether an item was evicted
   */
  bool      evict(SlotIndex* victim = CXX11_NULLPTR);

  /**
   * @brief Draws the given number of distinct slot indexes in [0, capacity).
   * @details
   * Robert Floyd's algorithm, so it takes exactly \e count draws from the random source.
   * @pre count <= capacity <= kMaxSlots
   */
  static void draw_distinct(
    assorted::UniformRandom* random,
    uint64_t capacity,
    uint64_t count,
    std::vector<SlotIndex>* out);

 private:
  KeyTable* const                 table_;
  assorted::UniformRandom* const  random_;
  const uint16_t                  samples_;
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_SAMPLED_LRU_EVICTOR_HPP_
