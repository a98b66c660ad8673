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
#include "cascache/cache/blob_pool.hpp"

#include <algorithm>
#include <cstring>
#include <ostream>
#include <string>

#include "cascache/assert_nd.hpp"
#include "cascache/cache/segment_layout.hpp"

namespace cascache {
namespace cache {

const uint64_t BlobPool::kZeroChunkSize;

uint64_t BlobRecord::get_record_size() const {
  return BlobPool::get_record_size(length_);
}

std::ostream& operator<<(std::ostream& o, const BlobRecord& v) {
  o << "<BlobRecord><address_>" << v.address_ << "</address_>"
    << "<tag_>" << static_cast<int>(v.tag_) << "</tag_>"
    << "<length_>" << v.length_ << "</length_></BlobRecord>";
  return o;
}

uint64_t BlobPool::get_start() const { return segment_->get_pool_start(); }
uint64_t BlobPool::get_size() const { return segment_->get_pool_size(); }
uint64_t BlobPool::get_used() const { return segment_->get_pool_used(); }
uint64_t BlobPool::get_next() const { return segment_->get_pool_next(); }

ErrorCode BlobPool::allocate(
  BlobTag tag,
  const void* data,
  uint64_t length,
  BlobAddress* address) {
  ASSERT_ND(tag == kBlobTagKey || tag == kBlobTagContent);
  if (length > kMaxBlobLength) {
    return kErrorCodeCacheTooLongBlob;
  }
  uint64_t record_size = get_record_size(length);
  if (!has_room_for(record_size)) {
    return kErrorCodeCachePoolFull;
  }

  BlobAddress next = get_next();
  ASSERT_ND(next % kBlobAlignment == 0);
  segment_->write_u8(next, static_cast<uint8_t>(tag));
  segment_->write_u32(next + 1U, static_cast<uint32_t>(length));
  if (length > 0) {
    segment_->write_bytes(next + kBlobHeaderSize, data, length);
  }
  // padding bytes are already zero

  segment_->set_pool_next(next + record_size);
  segment_->set_pool_used(get_used() + record_size);
  *address = next;
  return kErrorCodeOk;
}

ErrorCode BlobPool::inspect(BlobAddress address, BlobRecord* out) const {
  uint64_t start = get_start();
  uint64_t next = get_next();
  if (address < start
    || address >= next
    || address % kBlobAlignment != 0
    || next - address < kBlobHeaderSize
    || !segment_->contains_range(address, next - address)) {
    return kErrorCodeCacheCorruptBlob;
  }
  uint8_t tag = segment_->read_u8(address);
  if (tag != kBlobTagKey && tag != kBlobTagContent) {
    return kErrorCodeCacheCorruptBlob;
  }
  uint32_t length = segment_->read_u32(address + 1U);
  if (get_record_size(length) > next - address) {
    return kErrorCodeCacheCorruptBlob;
  }
  out->address_ = address;
  out->tag_ = static_cast<BlobTag>(tag);
  out->length_ = length;
  return kErrorCodeOk;
}

ErrorCode BlobPool::read(BlobAddress address, BlobTag expected_tag, std::string* out) const {
  BlobRecord record;
  CHECK_ERROR_CODE(inspect(address, &record));
  if (record.tag_ != expected_tag) {
    return kErrorCodeCacheCorruptBlob;
  }
  out->assign(segment_->bytes(record.get_data_offset(), record.length_), record.length_);
  return kErrorCodeOk;
}

ErrorCode BlobPool::equals(
  BlobAddress address,
  BlobTag expected_tag,
  const void* data,
  uint64_t length,
  bool* out) const {
  BlobRecord record;
  CHECK_ERROR_CODE(inspect(address, &record));
  if (record.tag_ != expected_tag) {
    return kErrorCodeCacheCorruptBlob;
  }
  *out = record.length_ == length
    && (length == 0
      || std::memcmp(segment_->bytes(record.get_data_offset(), length), data, length) == 0);
  return kErrorCodeOk;
}

void BlobPool::reset() {
  truncate(get_start());
}

void BlobPool::truncate(uint64_t new_next) {
  uint64_t old_next = get_next();
  ASSERT_ND(new_next >= get_start());
  ASSERT_ND(new_next <= old_next);
  for (uint64_t offset = new_next; offset < old_next; offset += kZeroChunkSize) {
    uint64_t chunk = std::min<uint64_t>(kZeroChunkSize, old_next - offset);
    segment_->zero_bytes(offset, chunk);
  }
  segment_->set_pool_next(new_next);
  segment_->set_pool_used(new_next - get_start());
}

}  // namespace cache
}  // namespace cascache
