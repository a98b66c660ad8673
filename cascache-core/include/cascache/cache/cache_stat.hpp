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
#ifndef CASCACHE_CACHE_CACHE_STAT_HPP_
#define CASCACHE_CACHE_CACHE_STAT_HPP_

#include <stdint.h>

#include <iosfwd>

namespace cascache {
namespace cache {

/**
 * @brief A snapshot of the state of a segment, taken under the cache lock.
 * @ingroup CACHE
 * @details
 * Hits and misses are counted in the segment header, so they are the totals of all processes.
 */
struct CacheStat {
  CacheStat();

  uint64_t  item_count_;
  uint64_t  max_items_;
  uint64_t  key_table_capacity_;
  uint64_t  content_table_capacity_;
  uint64_t  occupied_key_slots_;
  uint64_t  tombstone_key_slots_;
  /** Including entries no key refers to any more. */
  uint64_t  content_entries_;
  uint64_t  pool_size_;
  uint64_t  pool_used_;
  uint64_t  hits_;
  uint64_t  misses_;
  uint32_t  segment_version_;

  friend std::ostream& operator<<(std::ostream& o, const CacheStat& v);
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_CACHE_STAT_HPP_
