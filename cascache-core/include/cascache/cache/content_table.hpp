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
#ifndef CASCACHE_CACHE_CONTENT_TABLE_HPP_
#define CASCACHE_CACHE_CONTENT_TABLE_HPP_

#include <stdint.h>

#include <utility>
#include <vector>

#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/fwd.hpp"
#include "cascache/cache/hash128.hpp"
#include "cascache/cache/segment_layout.hpp"

namespace cascache {
namespace cache {

/**
 * @brief A pair of a content fingerprint and the address of its blob.
 * @ingroup CACHE
 */
typedef std::pair<Hash128, BlobAddress> ContentEntry;

/**
 * @brief Open-addressing hash table from content fingerprints to content blobs.
 * @ingroup CACHE
 * @details
 * Each slot is kContentEntrySize bytes: fingerprint (16) | content blob address (8).
 * An all-zero fingerprint means an empty slot.
 *
 * The probing is the same as KeyTable, but the fingerprint is the key itself.
 * A fingerprint match is taken as a content match without comparing the bytes, so two
 * different values with the same 128-bit fingerprint are conflated. The key table, in
 * contrast, always compares key bytes.
 *
 * There are no tombstones. One content entry might be shared by any number of keys, and
 * no single operation knows when the last reference goes away. Unreferenced entries stay
 * until Compactor rebuilds the table from the referenced ones.
 */
class ContentTable {
 public:
  explicit ContentTable(SegmentView* segment) : segment_(segment) {}

  uint64_t      get_capacity() const { return segment_->get_content_table_capacity(); }
  SlotIndex     get_home_slot(const Hash128& fingerprint) const {
    return fingerprint.modulo(get_capacity());
  }

  bool          is_occupied(SlotIndex slot) const { return !get_fingerprint(slot).is_zero(); }
  Hash128       get_fingerprint(SlotIndex slot) const {
    return segment_->read_hash(
      segment_->content_entry_offset(slot) + kContentEntryOffsetFingerprint);
  }
  BlobAddress   get_address(SlotIndex slot) const {
    return segment_->read_u64(segment_->content_entry_offset(slot) + kContentEntryOffsetAddress);
  }
  /** Only for Compactor, which moves content blobs. */
  void          set_address(SlotIndex slot, BlobAddress address) {
    segment_->write_u64(
      segment_->content_entry_offset(slot) + kContentEntryOffsetAddress,
      address);
  }

  /**
   * @brief Looks for the slot of the given fingerprint.
   * @return whether found
   */
  bool          find(const Hash128& fingerprint, SlotIndex* slot) const;

  /**
   * @brief Looks for an empty slot to insert the given fingerprint.
   * @return kErrorCodeCacheContentTableFull if every slot is occupied.
   */
  ErrorCode     find_empty(const Hash128& fingerprint, SlotIndex* slot) const;

  /** Writes a new entry to an empty slot. */
  void          install(SlotIndex slot, const Hash128& fingerprint, BlobAddress address);

  /** Makes every slot empty. */
  void          clear_all();

  /**
   * @brief Replaces the whole table with the given entries.
   * @details
   * Entries are inserted in ascending order of fingerprint so that the resulting table
   * depends only on the set of entries.
   * @return kErrorCodeCacheContentTableFull if there are more entries than slots.
   */
  ErrorCode     rebuild(std::vector<ContentEntry>* entries);

  /** Scans the whole table. */
  uint64_t      count_occupied() const;

 private:
  SegmentView* const segment_;
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_CONTENT_TABLE_HPP_
