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
#include "cascache/cache/content_table.hpp"

#include <algorithm>
#include <vector>

#include "cascache/assert_nd.hpp"

namespace cascache {
namespace cache {

bool ContentTable::find(const Hash128& fingerprint, SlotIndex* slot) const {
  ASSERT_ND(!fingerprint.is_zero());
  const uint64_t capacity = get_capacity();
  const SlotIndex home = get_home_slot(fingerprint);
  for (uint64_t i = 0; i < capacity; ++i) {
    SlotIndex cur = (home + i) % capacity;
    Hash128 stored = get_fingerprint(cur);
    if (stored.is_zero()) {
      return false;
    } else if (stored == fingerprint) {
      *slot = cur;
      return true;
    }
  }
  return false;
}

ErrorCode ContentTable::find_empty(const Hash128& fingerprint, SlotIndex* slot) const {
  const uint64_t capacity = get_capacity();
  const SlotIndex home = get_home_slot(fingerprint);
  for (uint64_t i = 0; i < capacity; ++i) {
    SlotIndex cur = (home + i) % capacity;
    if (!is_occupied(cur)) {
      *slot = cur;
      return kErrorCodeOk;
    }
  }
  return kErrorCodeCacheContentTableFull;
}

void ContentTable::install(SlotIndex slot, const Hash128& fingerprint, BlobAddress address) {
  ASSERT_ND(!is_occupied(slot));
  ASSERT_ND(!fingerprint.is_zero());
  uint64_t offset = segment_->content_entry_offset(slot);
  segment_->write_hash(offset + kContentEntryOffsetFingerprint, fingerprint);
  segment_->write_u64(offset + kContentEntryOffsetAddress, address);
}

void ContentTable::clear_all() {
  segment_->zero_bytes(segment_->get_content_table_start(), get_capacity() * kContentEntrySize);
}

ErrorCode ContentTable::rebuild(std::vector<ContentEntry>* entries) {
  if (entries->size() > get_capacity()) {
    return kErrorCodeCacheContentTableFull;
  }
  std::sort(entries->begin(), entries->end());
  clear_all();
  for (const ContentEntry& entry : *entries) {
    SlotIndex slot;
    CHECK_ERROR_CODE(find_empty(entry.first, &slot));
    install(slot, entry.first, entry.second);
  }
  return kErrorCodeOk;
}

uint64_t ContentTable::count_occupied() const {
  uint64_t count = 0;
  for (SlotIndex slot = 0; slot < get_capacity(); ++slot) {
    if (is_occupied(slot)) {
      ++count;
    }
  }
  return count;
}

}  // namespace cache
}  // namespace cascache
