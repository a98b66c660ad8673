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
#include "cascache/cache/key_table.hpp"

#include "cascache/assert_nd.hpp"
#include "cascache/cache/blob_pool.hpp"

namespace cascache {
namespace cache {

KeySlotState KeyTable::get_state(SlotIndex slot) const {
  Hash128 hash = get_hash(slot);
  if (hash.is_zero()) {
    return kKeySlotEmpty;
  } else if (hash.is_all_ones()) {
    return kKeySlotTombstone;
  }
  return kKeySlotOccupied;
}

ErrorCode KeyTable::find(
  const Hash128& key_hash,
  const void* key,
  uint64_t key_length,
  SlotIndex* slot) const {
  ASSERT_ND(!key_hash.is_zero() && !key_hash.is_all_ones());
  const uint64_t capacity = get_capacity();
  const SlotIndex home = get_home_slot(key_hash);
  for (uint64_t i = 0; i < capacity; ++i) {
    SlotIndex cur = (home + i) % capacity;
    Hash128 hash = get_hash(cur);
    if (hash.is_zero()) {
      return kErrorCodeCacheKeyNotFound;
    } else if (hash != key_hash) {
      continue;  // including tombstone
    }

    bool same = false;
    CHECK_ERROR_CODE(pool_->equals(get_key_address(cur), kBlobTagKey, key, key_length, &same));
    if (same) {
      *slot = cur;
      return kErrorCodeOk;
    }
  }
  return kErrorCodeCacheKeyNotFound;
}

ErrorCode KeyTable::find_empty_or_tombstone(const Hash128& key_hash, SlotIndex* slot) const {
  const uint64_t capacity = get_capacity();
  const SlotIndex home = get_home_slot(key_hash);
  for (uint64_t i = 0; i < capacity; ++i) {
    SlotIndex cur = (home + i) % capacity;
    if (get_state(cur) != kKeySlotOccupied) {
      *slot = cur;
      return kErrorCodeOk;
    }
  }
  return kErrorCodeCacheKeyTableFull;
}

void KeyTable::install(
  SlotIndex slot,
  const Hash128& key_hash,
  BlobAddress key_address,
  const Hash128& fingerprint,
  uint64_t timestamp) {
  ASSERT_ND(get_state(slot) != kKeySlotOccupied);
  ASSERT_ND(!key_hash.is_zero() && !key_hash.is_all_ones());
  uint64_t offset = segment_->key_entry_offset(slot);
  segment_->write_hash(offset + kKeyEntryOffsetHash, key_hash);
  segment_->write_u64(offset + kKeyEntryOffsetKeyAddress, key_address);
  segment_->write_hash(offset + kKeyEntryOffsetFingerprint, fingerprint);
  segment_->write_u64(offset + kKeyEntryOffsetTimestamp, timestamp);
  segment_->set_item_count(segment_->get_item_count() + 1U);
}

void KeyTable::tombstone(SlotIndex slot) {
  ASSERT_ND(get_state(slot) == kKeySlotOccupied);
  uint64_t offset = segment_->key_entry_offset(slot);
  segment_->zero_bytes(offset, kKeyEntrySize);
  segment_->write_hash(offset + kKeyEntryOffsetHash, Hash128::all_ones());
  uint64_t count = segment_->get_item_count();
  ASSERT_ND(count > 0);
  if (count > 0) {
    segment_->set_item_count(count - 1U);
  }
}

void KeyTable::clear_all() {
  segment_->zero_bytes(segment_->get_key_table_start(), get_capacity() * kKeyEntrySize);
  segment_->set_item_count(0);
}

uint64_t KeyTable::count_occupied() const {
  uint64_t count = 0;
  for (SlotIndex slot = 0; slot < get_capacity(); ++slot) {
    if (get_state(slot) == kKeySlotOccupied) {
      ++count;
    }
  }
  return count;
}

uint64_t KeyTable::count_tombstones() const {
  uint64_t count = 0;
  for (SlotIndex slot = 0; slot < get_capacity(); ++slot) {
    if (get_state(slot) == kKeySlotTombstone) {
      ++count;
    }
  }
  return count;
}

}  // namespace cache
}  // namespace cascache
