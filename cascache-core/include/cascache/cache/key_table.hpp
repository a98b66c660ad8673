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
#ifndef CASCACHE_CACHE_KEY_TABLE_HPP_
#define CASCACHE_CACHE_KEY_TABLE_HPP_

#include <stdint.h>

#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/fwd.hpp"
#include "cascache/cache/hash128.hpp"
#include "cascache/cache/segment_layout.hpp"

namespace cascache {
namespace cache {

/**
 * @brief Open-addressing hash table from keys to fingerprints of their values.
 * @ingroup CACHE
 * @details
 * @par Entry
 * Each slot is kKeyEntrySize bytes:
 * key hash (16) | key blob address (8) | content fingerprint (16) | last access in ns (8).
 *
 * @par Probing
 * Linear probing from the home slot, key_hash mod capacity, where the hash is read as a
 * big-endian 128-bit integer. A probe stops at an empty slot or when it wraps back to the
 * home slot. Tombstones are skipped. A slot with the same hash is a match only if the key
 * blob has exactly the same bytes.
 *
 * @par Deletion
 * A deleted slot becomes a tombstone: all-0xFF hash and zeros elsewhere. It must not become
 * all-zero, because that would cut the probe chain of every key that was inserted past it.
 * Tombstones are reused by insertions and never turn back into empty slots except by clear_all().
 *
 * @par Item Count
 * install() and tombstone() maintain the item count in the header, which always equals the
 * number of occupied slots.
 *
 * Like BlobPool, this is a stateless wrapper. All state lives in the segment.
 */
class KeyTable {
 public:
  KeyTable(SegmentView* segment, const BlobPool* pool) : segment_(segment), pool_(pool) {}

  uint64_t      get_capacity() const { return segment_->get_key_table_capacity(); }
  uint64_t      get_item_count() const { return segment_->get_item_count(); }
  uint64_t      get_max_items() const { return segment_->get_max_items(); }
  SlotIndex     get_home_slot(const Hash128& key_hash) const {
    return key_hash.modulo(get_capacity());
  }

  KeySlotState  get_state(SlotIndex slot) const;
  Hash128       get_hash(SlotIndex slot) const {
    return segment_->read_hash(segment_->key_entry_offset(slot) + kKeyEntryOffsetHash);
  }
  BlobAddress   get_key_address(SlotIndex slot) const {
    return segment_->read_u64(segment_->key_entry_offset(slot) + kKeyEntryOffsetKeyAddress);
  }
  Hash128       get_fingerprint(SlotIndex slot) const {
    return segment_->read_hash(segment_->key_entry_offset(slot) + kKeyEntryOffsetFingerprint);
  }
  uint64_t      get_timestamp(SlotIndex slot) const {
    return segment_->read_u64(segment_->key_entry_offset(slot) + kKeyEntryOffsetTimestamp);
  }

  /**
   * @brief Looks for the slot of the given key.
   * @param[in] key_hash to_key_hash() of the key's digest
   * @param[in] key the key bytes, compared with the key blob upon a hash match
   * @param[in] key_length byte length of key
   * @param[out] slot the slot of the key if found
   * @return kErrorCodeCacheKeyNotFound if there is no such key.
   * kErrorCodeCacheCorruptBlob if a hash-matching slot refers to a broken key blob.
   */
  ErrorCode     find(
    const Hash128& key_hash,
    const void* key,
    uint64_t key_length,
    SlotIndex* slot) const;

  /**
   * @brief Looks for a slot to insert a key of the given hash.
   * @details
   * Returns the first empty or tombstone slot in the probe sequence.
   * The caller must have confirmed with find() that the key is not in the table.
   * @return kErrorCodeCacheKeyTableFull if every slot is occupied.
   */
  ErrorCode     find_empty_or_tombstone(const Hash128& key_hash, SlotIndex* slot) const;

  /**
   * Writes a new entry to an empty or tombstone slot and increments the item count.
   */
  void          install(
    SlotIndex slot,
    const Hash128& key_hash,
    BlobAddress key_address,
    const Hash128& fingerprint,
    uint64_t timestamp);

  /** Turns an occupied slot into a tombstone and decrements the item count. */
  void          tombstone(SlotIndex slot);

  /** Updates the last-access timestamp. */
  void          touch(SlotIndex slot, uint64_t timestamp) {
    segment_->write_u64(segment_->key_entry_offset(slot) + kKeyEntryOffsetTimestamp, timestamp);
  }
  /** Makes the key refer to another value. */
  void          set_fingerprint(SlotIndex slot, const Hash128& fingerprint) {
    segment_->write_hash(
      segment_->key_entry_offset(slot) + kKeyEntryOffsetFingerprint,
      fingerprint);
  }
  /** Only for Compactor, which moves key blobs. */
  void          set_key_address(SlotIndex slot, BlobAddress address) {
    segment_->write_u64(segment_->key_entry_offset(slot) + kKeyEntryOffsetKeyAddress, address);
  }

  /** Makes every slot empty (not tombstone) and resets the item count. */
  void          clear_all();

  /** Scans the whole table. */
  uint64_t      count_occupied() const;
  /** Scans the whole table. */
  uint64_t      count_tombstones() const;

 private:
  SegmentView* const    segment_;
  const BlobPool* const pool_;
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_KEY_TABLE_HPP_
