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
#ifndef CASCACHE_CACHE_CONTENT_CURSOR_HPP_
#define CASCACHE_CACHE_CONTENT_CURSOR_HPP_

#include <stdint.h>

#include <string>

#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/fwd.hpp"
#include "cascache/cache/hash128.hpp"

namespace cascache {
namespace cache {

/**
 * @brief Iterates over distinct values in the cache, one at a time.
 * @ingroup CACHE
 * @details
 * Each value appears once with its fingerprint, no matter how many keys refer to it.
 * The cursor holds only the current value, and takes the cache lock only while it moves,
 * so other processes can keep using the cache in between.
 *
 * Values set while iterating might or might not be visited. Values whose keys were all deleted
 * or evicted are still visited until compaction, because content entries are reclaimed only
 * then. If the segment is compacted or cleared while iterating, blobs might have moved and
 * the cursor fails with kErrorCodeCacheCursorInvalidated. rewind() starts over in that case.
 *
 * @code{.cpp}
 * ContentCursor cursor(&cache);
 * for (WRAP_ERROR_CODE(cursor.open()); cursor.is_valid(); WRAP_ERROR_CODE(cursor.next())) {
 *   std::cout << cursor.get_fingerprint() << cursor.get_content().size();
 * }
 * @endcode
 */
class ContentCursor CXX11_FINAL {
 public:
  explicit ContentCursor(ContentCache* cache);

  // Disable copy constructors
  ContentCursor(const ContentCursor&) CXX11_FUNC_DELETE;
  ContentCursor& operator=(const ContentCursor&) CXX11_FUNC_DELETE;

  /** Moves to the first value, if any. */
  ErrorCode     open();
  /** Same as open(). */
  ErrorCode     rewind() { return open(); }
  /**
   * Moves to the next value, if any.
   * @return kErrorCodeCacheCursorInvalidated if the segment was compacted or cleared
   */
  ErrorCode     next();

  /** Whether the cursor points to a value. False after the last value. */
  bool          is_valid() const { return valid_; }
  /** @pre is_valid() */
  const Hash128&      get_fingerprint() const { return fingerprint_; }
  /** @pre is_valid() */
  const std::string&  get_content() const { return content_; }

 private:
  ContentCache* const cache_;
  bool                opened_;
  bool                valid_;
  /** The segment version when opened. */
  uint32_t            segment_version_;
  /** Next content table slot to look at. */
  SlotIndex           next_slot_;
  Hash128             fingerprint_;
  std::string         content_;

  /** Moves to the first occupied slot at or after next_slot_. The lock must be held. */
  ErrorCode     advance();
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_CONTENT_CURSOR_HPP_
