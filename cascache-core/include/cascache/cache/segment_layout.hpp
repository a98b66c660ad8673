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
#ifndef CASCACHE_CACHE_SEGMENT_LAYOUT_HPP_
#define CASCACHE_CACHE_SEGMENT_LAYOUT_HPP_

#include <stdint.h>

#include <cstring>
#include <iosfwd>

#include "cascache/assert_nd.hpp"
#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"
#include "cascache/assorted/endianness.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/hash128.hpp"

namespace cascache {
namespace cache {

/**
 * @brief Sizes and offsets of the four regions of a segment.
 * @ingroup CACHE
 * @details
 * Computed once when the segment is created, then written to the header.
 * Attaching processes read them back from the header and never recompute them.
 */
struct SegmentGeometry {
  uint64_t  total_size_;
  uint64_t  pool_start_;
  uint64_t  pool_size_;
  uint64_t  key_table_start_;
  uint64_t  key_table_capacity_;
  uint64_t  content_table_start_;
  uint64_t  content_table_capacity_;
  uint64_t  max_items_;

  /**
   * @brief Derives the geometry from the cache configuration.
   * @param[in] maxsize maximum number of items. Must be positive.
   * @param[in] load_factor in (0, 1]. Each table has floor(maxsize / load_factor) slots.
   * @param[in] average_key_size expected byte size of a key
   * @param[in] average_value_size expected byte size of a value
   * @param[out] out the geometry
   * @details
   * The pool is sized so that maxsize distinct keys and values of the average sizes fit,
   * including the record header and alignment of each blob.
   */
  static ErrorCode compute(
    uint64_t maxsize,
    double load_factor,
    uint32_t average_key_size,
    uint32_t average_value_size,
    SegmentGeometry* out);

  friend std::ostream& operator<<(std::ostream& o, const SegmentGeometry& v);
};

/**
 * @brief The only class that touches raw bytes of a segment.
 * @ingroup CACHE
 * @details
 * Everything else in the cache package speaks in terms of absolute offsets (BlobAddress) and
 * slot indexes, and reads or writes the segment through this class.
 * Each access is checked to stay within the segment. Offsets derived from a validated header
 * are trusted, so the check is an ASSERT_ND. Blob addresses read from the tables are \e not
 * trusted and BlobPool checks them with contains_range() before reading.
 *
 * This object is a process-local view. It is cheap to copy and holds no ownership.
 *
 * @par Header
 * All fields are big-endian.
 * <table>
 * <tr><th>Offset</th><th>Width</th><th>Field</th></tr>
 * <tr><td>0</td><td>8</td><td>magic | format version</td></tr>
 * <tr><td>8</td><td>4</td><td>format version</td></tr>
 * <tr><td>12</td><td>4</td><td>segment version</td></tr>
 * <tr><td>16</td><td>8</td><td>total segment size</td></tr>
 * <tr><td>24</td><td>8</td><td>blob pool start</td></tr>
 * <tr><td>32</td><td>8</td><td>blob pool size</td></tr>
 * <tr><td>40</td><td>8</td><td>blob pool used</td></tr>
 * <tr><td>48</td><td>8</td><td>blob pool next-free</td></tr>
 * <tr><td>56</td><td>8</td><td>key table start</td></tr>
 * <tr><td>64</td><td>8</td><td>key table capacity (slots)</td></tr>
 * <tr><td>72</td><td>8</td><td>content table start</td></tr>
 * <tr><td>80</td><td>8</td><td>content table capacity (slots)</td></tr>
 * <tr><td>88</td><td>8</td><td>configured max items</td></tr>
 * <tr><td>96</td><td>8</td><td>current live items</td></tr>
 * <tr><td>104</td><td>8</td><td>hit counter</td></tr>
 * <tr><td>112</td><td>8</td><td>miss counter</td></tr>
 * </table>
 * The rest of the header is reserved and zero.
 */
class SegmentView {
 public:
  SegmentView() : base_(CXX11_NULLPTR), size_(0) {}
  SegmentView(char* base, uint64_t size) : base_(base), size_(size) {}

  bool        is_null() const { return base_ == CXX11_NULLPTR; }
  char*       get_base() const { return base_; }
  /** Byte size of the mapped memory, which might be larger than get_total_size(). */
  uint64_t    get_mapped_size() const { return size_; }

  /**
   * Writes a fresh header for the geometry and zero-clears the rest of the segment.
   * @pre get_mapped_size() >= geometry.total_size_
   */
  void        format(const SegmentGeometry& geometry);

  /**
   * @brief Checks the magic word, the format version and the consistency of the geometry.
   * @return kErrorCodeCacheInvalidMagic, kErrorCodeCacheVersionMismatch or
   * kErrorCodeCacheCorruptHeader, all of which are configuration errors.
   */
  ErrorCode   validate() const;

  /** Reads back the geometry from the header. */
  SegmentGeometry get_geometry() const;

  /** Whether [offset, offset + length) is within the segment. Never overflows. */
  bool contains_range(uint64_t offset, uint64_t length) const {
    return offset <= size_ && length <= size_ - offset;
  }

  // raw accessors. offsets are absolute in the segment.
  uint64_t read_u64(uint64_t offset) const {
    return assorted::read_bigendian_unaligned<uint64_t>(address(offset, sizeof(uint64_t)));
  }
  uint32_t read_u32(uint64_t offset) const {
    return assorted::read_bigendian_unaligned<uint32_t>(address(offset, sizeof(uint32_t)));
  }
  uint8_t read_u8(uint64_t offset) const {
    return *reinterpret_cast<const uint8_t*>(address(offset, 1));
  }
  void write_u64(uint64_t offset, uint64_t value) {
    assorted::write_bigendian_unaligned<uint64_t>(value, address(offset, sizeof(uint64_t)));
  }
  void write_u32(uint64_t offset, uint32_t value) {
    assorted::write_bigendian_unaligned<uint32_t>(value, address(offset, sizeof(uint32_t)));
  }
  void write_u8(uint64_t offset, uint8_t value) {
    *reinterpret_cast<uint8_t*>(address(offset, 1)) = value;
  }
  Hash128 read_hash(uint64_t offset) const {
    Hash128 ret;
    std::memcpy(ret.bytes_, address(offset, sizeof(ret.bytes_)), sizeof(ret.bytes_));
    return ret;
  }
  void write_hash(uint64_t offset, const Hash128& value) {
    std::memcpy(address(offset, sizeof(value.bytes_)), value.bytes_, sizeof(value.bytes_));
  }
  /** Pointer to length bytes at offset, for bulk reads. */
  const char* bytes(uint64_t offset, uint64_t length) const { return address(offset, length); }
  void write_bytes(uint64_t offset, const void* data, uint64_t length) {
    std::memcpy(address(offset, length), data, length);
  }
  void zero_bytes(uint64_t offset, uint64_t length) {
    std::memset(address(offset, length), 0, length);
  }
  /** memmove within the segment. The ranges may overlap. */
  void move_bytes(uint64_t to, uint64_t from, uint64_t length) {
    std::memmove(address(to, length), address(from, length), length);
  }

  // header accessors
  uint64_t  get_magic() const             { return read_u64(kHeaderOffsetMagic); }
  uint32_t  get_format_version() const    { return read_u32(kHeaderOffsetFormatVersion); }
  uint32_t  get_segment_version() const   { return read_u32(kHeaderOffsetSegmentVersion); }
  uint64_t  get_total_size() const        { return read_u64(kHeaderOffsetTotalSize); }
  uint64_t  get_pool_start() const        { return read_u64(kHeaderOffsetPoolStart); }
  uint64_t  get_pool_size() const         { return read_u64(kHeaderOffsetPoolSize); }
  uint64_t  get_pool_used() const         { return read_u64(kHeaderOffsetPoolUsed); }
  uint64_t  get_pool_next() const         { return read_u64(kHeaderOffsetPoolNext); }
  uint64_t  get_key_table_start() const   { return read_u64(kHeaderOffsetKeyTableStart); }
  uint64_t  get_key_table_capacity() const  { return read_u64(kHeaderOffsetKeyTableCapacity); }
  uint64_t  get_content_table_start() const { return read_u64(kHeaderOffsetContentTableStart); }
  uint64_t  get_content_table_capacity() const {
    return read_u64(kHeaderOffsetContentTableCapacity);
  }
  uint64_t  get_max_items() const         { return read_u64(kHeaderOffsetMaxItems); }
  uint64_t  get_item_count() const        { return read_u64(kHeaderOffsetItemCount); }
  uint64_t  get_hits() const              { return read_u64(kHeaderOffsetHits); }
  uint64_t  get_misses() const            { return read_u64(kHeaderOffsetMisses); }

  void      set_pool_used(uint64_t value)   { write_u64(kHeaderOffsetPoolUsed, value); }
  void      set_pool_next(uint64_t value)   { write_u64(kHeaderOffsetPoolNext, value); }
  void      set_item_count(uint64_t value)  { write_u64(kHeaderOffsetItemCount, value); }
  void      increment_hits()    { write_u64(kHeaderOffsetHits, get_hits() + 1U); }
  void      increment_misses()  { write_u64(kHeaderOffsetMisses, get_misses() + 1U); }
  /** Called when blobs moved or entries disappeared in bulk. Wraps around. */
  void      bump_segment_version() {
    write_u32(kHeaderOffsetSegmentVersion, get_segment_version() + 1U);
  }

  /** Absolute offset of the given key table slot. */
  uint64_t  key_entry_offset(SlotIndex slot) const {
    ASSERT_ND(slot < get_key_table_capacity());
    return get_key_table_start() + slot * kKeyEntrySize;
  }
  /** Absolute offset of the given content table slot. */
  uint64_t  content_entry_offset(SlotIndex slot) const {
    ASSERT_ND(slot < get_content_table_capacity());
    return get_content_table_start() + slot * kContentEntrySize;
  }

  friend std::ostream& operator<<(std::ostream& o, const SegmentView& v);

 private:
  char*     base_;
  uint64_t  size_;

  char* address(uint64_t offset, uint64_t length) const {
    ASSERT_ND(base_);
    ASSERT_ND(contains_range(offset, length));
    return base_ + offset;
  }
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_SEGMENT_LAYOUT_HPP_
