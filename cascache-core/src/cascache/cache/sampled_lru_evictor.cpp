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
#include "cascache/cache/sampled_lru_evictor.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <set>
#include <vector>

#include "cascache/assert_nd.hpp"
#include "cascache/cache/key_table.hpp"

namespace cascache {
namespace cache {

uint64_t SampledLruEvictor::get_max_draws() const {
  uint64_t capacity = table_->get_capacity();
  uint64_t max_items = std::max<uint64_t>(1U, table_->get_max_items());
  // 2 * samples / (max_items / capacity)
  uint64_t draws = (2ULL * samples_ * capacity) / max_items;
  return std::min<uint64_t>(std::max<uint64_t>(draws, samples_), capacity);
}

void SampledLruEvictor::draw_distinct(
  assorted::UniformRandom* random,
  uint64_t capacity,
  uint64_t count,
  std::vector<SlotIndex>* out) {
  ASSERT_ND(count <= capacity);
  ASSERT_ND(capacity <= kMaxSlots);
  out->clear();
  out->reserve(count);
  std::set<SlotIndex> chosen;
  for (uint64_t j = capacity - count; j < capacity; ++j) {
    SlotIndex t = random->uniform_within(0, static_cast<uint32_t>(j));
    if (chosen.find(t) == chosen.end()) {
      chosen.insert(t);
      out->push_back(t);
    } else {
      chosen.insert(j);
      out->push_back(j);
    }
  }
}

bool SampledLruEvictor::choose_victim(SlotIndex* victim) {
  std::vector<SlotIndex> candidates;
  draw_distinct(random_, table_->get_capacity(), get_max_draws(), &candidates);

  bool found = false;
  uint16_t occupied = 0;
  uint64_t oldest_timestamp = 0;
  for (SlotIndex slot : candidates) {
    if (occupied >= samples_) {
      break;
    }
    if (table_->get_state(slot) != kKeySlotOccupied) {
      continue;
    }
    ++occupied;
    uint64_t timestamp = table_->get_timestamp(slot);
    if (!found || timestamp < oldest_timestamp) {
      found = true;
      oldest_timestamp = timestamp;
      *victim = slot;
    }
  }
  VLOG(2) << "Sampled " << occupied << " occupied slots out of " << candidates.size()
    << " draws";
  return found;
}

bool SampledLruEvictor::evict(SlotIndex* victim) {
  SlotIndex slot;
  if (!choose_victim(&slot)) {
    LOG(WARNING) << "Eviction found no occupied slot in the samples. item_count="
      << table_->get_item_count() << ", capacity=" << table_->get_capacity();
    return false;
  }
  VLOG(1) << "Evicting slot " << slot << ", last accessed at " << table_->get_timestamp(slot);
  table_->tombstone(slot);
  if (victim) {
    *victim = slot;
  }
  return true;
}

}  // namespace cache
}  // namespace cascache
