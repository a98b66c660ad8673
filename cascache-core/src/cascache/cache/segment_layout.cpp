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
#include "cascache/cache/segment_layout.hpp"

#include <cmath>
#include <limits>
#include <ostream>

#include "cascache/assorted/assorted_func.hpp"
#include "cascache/assorted/atomic_fences.hpp"

namespace cascache {
namespace cache {

ErrorCode SegmentGeometry::compute(
  uint64_t maxsize,
  double load_factor,
  uint32_t average_key_size,
  uint32_t average_value_size,
  SegmentGeometry* out) {
  if (maxsize == 0) {
    return kErrorCodeCacheInvalidMaxsize;
  }
  // also rejects NaN
  if (!(load_factor > 0.0 && load_factor <= 1.0)) {
    return kErrorCodeCacheInvalidLoadFactor;
  }
  if (maxsize > kMaxSlots) {
    return kErrorCodeCacheTooManySlots;
  }
  double slots_double = std::floor(static_cast<double>(maxsize) / load_factor);
  if (slots_double > static_cast<double>(kMaxSlots)) {
    return kErrorCodeCacheTooManySlots;
  }
  uint64_t slots = static_cast<uint64_t>(slots_double);
  if (slots < maxsize) {
    // only by rounding error when load_factor == 1
    slots = maxsize;
  }

  uint64_t key_record = assorted::align8<uint64_t>(
    static_cast<uint64_t>(kBlobHeaderSize) + average_key_size);
  uint64_t value_record = assorted::align8<uint64_t>(
    static_cast<uint64_t>(kBlobHeaderSize) + average_value_size);
  uint64_t per_item = key_record + value_record;
  uint64_t tables_size = slots * (kKeyEntrySize + kContentEntrySize);
  uint64_t pool_limit = std::numeric_limits<uint64_t>::max() - kHeaderSize - tables_size;
  if (maxsize > pool_limit / per_item) {
    return kErrorCodeCacheSegmentTooLarge;
  }

  out->max_items_ = maxsize;
  out->pool_start_ = kHeaderSize;
  out->pool_size_ = maxsize * per_item;
  out->key_table_start_ = out->pool_start_ + out->pool_size_;
  out->key_table_capacity_ = slots;
  out->content_table_start_ = out->key_table_start_ + slots * kKeyEntrySize;
  out->content_table_capacity_ = slots;
  out->total_size_ = out->content_table_start_ + slots * kContentEntrySize;
  return kErrorCodeOk;
}

void SegmentView::format(const SegmentGeometry& geometry) {
  ASSERT_ND(geometry.total_size_ <= size_);
  zero_bytes(0, geometry.total_size_);
  write_u32(kHeaderOffsetFormatVersion, kFormatVersion);
  write_u32(kHeaderOffsetSegmentVersion, 0);
  write_u64(kHeaderOffsetTotalSize, geometry.total_size_);
  write_u64(kHeaderOffsetPoolStart, geometry.pool_start_);
  write_u64(kHeaderOffsetPoolSize, geometry.pool_size_);
  write_u64(kHeaderOffsetPoolUsed, 0);
  write_u64(kHeaderOffsetPoolNext, geometry.pool_start_);
  write_u64(kHeaderOffsetKeyTableStart, geometry.key_table_start_);
  write_u64(kHeaderOffsetKeyTableCapacity, geometry.key_table_capacity_);
  write_u64(kHeaderOffsetContentTableStart, geometry.content_table_start_);
  write_u64(kHeaderOffsetContentTableCapacity, geometry.content_table_capacity_);
  write_u64(kHeaderOffsetMaxItems, geometry.max_items_);
  write_u64(kHeaderOffsetItemCount, 0);
  write_u64(kHeaderOffsetHits, 0);
  write_u64(kHeaderOffsetMisses, 0);
  // magic word comes last. attaching processes wait until it becomes non-zero.
  assorted::memory_fence_release();
  write_u64(kHeaderOffsetMagic, kMagic);
}

ErrorCode SegmentView::validate() const {
  if (base_ == CXX11_NULLPTR || size_ < kHeaderSize) {
    return kErrorCodeCacheCorruptHeader;
  }
  uint64_t magic = get_magic();
  if ((magic & kMagicBaseMask) != kMagicBase) {
    return kErrorCodeCacheInvalidMagic;
  }
  if ((magic & ~kMagicBaseMask) != kFormatVersion || get_format_version() != kFormatVersion) {
    return kErrorCodeCacheVersionMismatch;
  }

  SegmentGeometry geometry = get_geometry();
  if (geometry.total_size_ > size_
    || geometry.pool_start_ != kHeaderSize
    || geometry.key_table_capacity_ == 0 || geometry.key_table_capacity_ > kMaxSlots
    || geometry.content_table_capacity_ == 0 || geometry.content_table_capacity_ > kMaxSlots
    || geometry.max_items_ == 0 || geometry.max_items_ > geometry.key_table_capacity_
    || geometry.pool_size_ > size_
    || geometry.key_table_start_ != geometry.pool_start_ + geometry.pool_size_
    || geometry.content_table_start_
      != geometry.key_table_start_ + geometry.key_table_capacity_ * kKeyEntrySize
    || geometry.total_size_
      != geometry.content_table_start_ + geometry.content_table_capacity_ * kContentEntrySize) {
    return kErrorCodeCacheCorruptHeader;
  }
  if (get_pool_used() > geometry.pool_size_
    || get_pool_next() != geometry.pool_start_ + get_pool_used()
    || get_item_count() > geometry.key_table_capacity_) {
    return kErrorCodeCacheCorruptHeader;
  }
  return kErrorCodeOk;
}

SegmentGeometry SegmentView::get_geometry() const {
  SegmentGeometry ret;
  ret.total_size_ = get_total_size();
  ret.pool_start_ = get_pool_start();
  ret.pool_size_ = get_pool_size();
  ret.key_table_start_ = get_key_table_start();
  ret.key_table_capacity_ = get_key_table_capacity();
  ret.content_table_start_ = get_content_table_start();
  ret.content_table_capacity_ = get_content_table_capacity();
  ret.max_items_ = get_max_items();
  return ret;
}

std::ostream& operator<<(std::ostream& o, const SegmentGeometry& v) {
  o << "<SegmentGeometry>"
    << "<total_size_>" << v.total_size_ << "</total_size_>"
    << "<pool_start_>" << v.pool_start_ << "</pool_start_>"
    << "<pool_size_>" << v.pool_size_ << "</pool_size_>"
    << "<key_table_start_>" << v.key_table_start_ << "</key_table_start_>"
    << "<key_table_capacity_>" << v.key_table_capacity_ << "</key_table_capacity_>"
    << "<content_table_start_>" << v.content_table_start_ << "</content_table_start_>"
    << "<content_table_capacity_>" << v.content_table_capacity_ << "</content_table_capacity_>"
    << "<max_items_>" << v.max_items_ << "</max_items_>"
    << "</SegmentGeometry>";
  return o;
}

std::ostream& operator<<(std::ostream& o, const SegmentView& v) {
  o << "<SegmentHeader>";
  if (v.is_null() || v.get_mapped_size() < kHeaderSize) {
    o << "<null />";
  } else {
    o << "<magic>" << assorted::Hex(v.get_magic(), 16) << "</magic>"
      << "<format_version>" << v.get_format_version() << "</format_version>"
      << "<segment_version>" << v.get_segment_version() << "</segment_version>"
      << "<total_size>" << v.get_total_size() << "</total_size>"
      << "<pool_start>" << v.get_pool_start() << "</pool_start>"
      << "<pool_size>" << v.get_pool_size() << "</pool_size>"
      << "<pool_used>" << v.get_pool_used() << "</pool_used>"
      << "<pool_next>" << v.get_pool_next() << "</pool_next>"
      << "<key_table_start>" << v.get_key_table_start() << "</key_table_start>"
      << "<key_table_capacity>" << v.get_key_table_capacity() << "</key_table_capacity>"
      << "<content_table_start>" << v.get_content_table_start() << "</content_table_start>"
      << "<content_table_capacity>" << v.get_content_table_capacity()
        << "</content_table_capacity>"
      << "<max_items>" << v.get_max_items() << "</max_items>"
      << "<item_count>" << v.get_item_count() << "</item_count>"
      << "<hits>" << v.get_hits() << "</hits>"
      << "<misses>" << v.get_misses() << "</misses>";
  }
  o << "</SegmentHeader>";
  return o;
}

}  // namespace cache
}  // namespace cascache
