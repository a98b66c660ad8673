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
#include "cascache/cache/content_cursor.hpp"

#include <glog/logging.h>

#include <string>

#include "cascache/cache/content_cache.hpp"
#include "cascache/soc/shared_mutex.hpp"

namespace cascache {
namespace cache {

ContentCursor::ContentCursor(ContentCache* cache)
  : cache_(cache),
    opened_(false),
    valid_(false),
    segment_version_(0),
    next_slot_(0),
    fingerprint_(Hash128::zero()) {
}

ErrorCode ContentCursor::open() {
  soc::SharedMutexScope scope(cache_->get_lock(), false);
  CHECK_ERROR_CODE(cache_->acquire_lock(&scope));
  opened_ = true;
  segment_version_ = cache_->segment_.get_segment_version();
  next_slot_ = 0;
  return advance();
}

ErrorCode ContentCursor::next() {
  if (!opened_) {
    return kErrorCodeNotInitialized;
  } else if (!valid_) {
    return kErrorCodeOk;
  }
  soc::SharedMutexScope scope(cache_->get_lock(), false);
  CHECK_ERROR_CODE(cache_->acquire_lock(&scope));
  return advance();
}

ErrorCode ContentCursor::advance() {
  valid_ = false;
  content_.clear();
  if (cache_->segment_.get_segment_version() != segment_version_) {
    VLOG(0) << "Content cursor invalidated. version " << segment_version_ << " -> "
      << cache_->segment_.get_segment_version();
    return kErrorCodeCacheCursorInvalidated;
  }

  ContentTable& table = cache_->content_table_;
  for (; next_slot_ < table.get_capacity(); ++next_slot_) {
    if (!table.is_occupied(next_slot_)) {
      continue;
    }
    fingerprint_ = table.get_fingerprint(next_slot_);
    CHECK_ERROR_CODE(cache_->pool_.read(table.get_address(next_slot_), kBlobTagContent, &content_));
    ++next_slot_;
    valid_ = true;
    break;
  }
  return kErrorCodeOk;
}

}  // namespace cache
}  // namespace cascache
