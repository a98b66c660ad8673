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
#ifndef CASCACHE_CACHE_COMPACTOR_HPP_
#define CASCACHE_CACHE_COMPACTOR_HPP_

#include <stdint.h>

#include <iosfwd>
#include <map>
#include <set>
#include <vector>

#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/content_table.hpp"
#include "cascache/cache/fwd.hpp"
#include "cascache/cache/hash128.hpp"

namespace cascache {
namespace cache {

/**
 * @brief What a compaction did.
 * @ingroup CACHE
 */
struct CompactionResult {
  CompactionResult();

  /** Number of blobs that survived. */
  uint64_t  live_blobs_;
  /** Number of blobs that were copied to a lower address. */
  uint64_t  moved_blobs_;
  /** Number of references to broken or overlapping blobs that were logged and skipped. */
  uint64_t  skipped_references_;
  /** Number of key entries tombstoned because they referred to broken data. */
  uint64_t  dropped_keys_;
  /** Number of content entries removed, mostly because no key referred to them. */
  uint64_t  dropped_contents_;
  /** Whether the content table has entries at different slots than before. */
  bool      relocated_contents_;
  uint64_t  used_before_;
  uint64_t  used_after_;

  /** Whether anything in the segment other than zeroed garbage has changed. */
  bool      is_changed() const {
    return moved_blobs_ > 0 || dropped_keys_ > 0 || dropped_contents_ > 0
      || relocated_contents_ || used_before_ != used_after_;
  }
  friend std::ostream& operator<<(std::ostream& o, const CompactionResult& v);
};

/**
 * @brief Mark-and-copy defragmentation of the blob pool.
 * @ingroup CACHE
 * @details
 * Runs only when explicitly called, within the cache lock, and stops the world meanwhile.
 *
 * @par Mark
 * Every occupied key entry marks its key blob and its fingerprint. Every content entry whose
 * fingerprint is marked marks its content blob. Each marked address is validated by
 * BlobPool::inspect(). A reference to a broken blob (outside the pool, unaligned, bad tag, bad
 * length, or overlapping another live blob) is logged and skipped, never crashing the
 * compactor. A key entry that refers to a skipped key blob or to a fingerprint without a valid
 * content blob is tombstoned, because it can never be read again.
 *
 * @par Copy
 * Live blobs are copied in ascending order of their old address to a pointer that starts at
 * the beginning of the pool. A blob's new address is never larger than its old one, so copying
 * one blob never overwrites another that is yet to be copied.
 *
 * @par Rewrite
 * Key entries get their new key blob addresses. The content table is rebuilt from the live
 * entries in ascending order of fingerprint, which also drops unreferenced entries.
 * Finally the bytes between the new and the old end of the pool are zeroed in chunks of
 * BlobPool::kZeroChunkSize.
 *
 * @par Idempotence
 * The result depends only on the set of live data, so compacting twice in a row leaves the
 * second run with nothing to change.
 */
class Compactor {
 public:
  Compactor(SegmentView* segment, BlobPool* pool, KeyTable* key_table, ContentTable* content_table)
    : segment_(segment), pool_(pool), key_table_(key_table), content_table_(content_table) {}

  /**
   * @brief Compacts the pool. Bumps the segment version if anything changed.
   * @param[out] result what it did
   */
  ErrorCode compact(CompactionResult* result);

 private:
  SegmentView* const  segment_;
  BlobPool* const     pool_;
  KeyTable* const     key_table_;
  ContentTable* const content_table_;

  /** Fingerprint to content blob address of content entries with a valid blob. */
  std::map<Hash128, BlobAddress>  valid_contents_;
  /** Key slots to keep. */
  std::vector<SlotIndex>          live_keys_;
  /** Live blob address to its record size. */
  std::map<BlobAddress, uint64_t> live_blobs_;
  /** Blobs found to overlap a live one. Excluded from all later marks. */
  std::set<BlobAddress>           excluded_;

  void      mark(CompactionResult* result);
  /** @return whether any blob overlapping another was found and excluded. */
  bool      exclude_overlaps(CompactionResult* result);
  void      copy(std::map<BlobAddress, BlobAddress>* relocation, uint64_t* new_next);
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_COMPACTOR_HPP_
