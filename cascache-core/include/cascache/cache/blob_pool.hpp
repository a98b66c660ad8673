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
#ifndef CASCACHE_CACHE_BLOB_POOL_HPP_
#define CASCACHE_CACHE_BLOB_POOL_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>

#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"
#include "cascache/assorted/assorted_func.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/fwd.hpp"

namespace cascache {
namespace cache {

/**
 * @brief Decoded header of a blob record.
 * @ingroup CACHE
 */
struct BlobRecord {
  BlobAddress address_;
  BlobTag     tag_;
  uint32_t    length_;

  /** Byte size of the whole record including the header and padding. */
  uint64_t    get_record_size() const;
  /** Absolute offset of the first data byte. */
  uint64_t    get_data_offset() const { return address_ + kBlobHeaderSize; }
  friend std::ostream& operator<<(std::ostream& o, const BlobRecord& v);
};

/**
 * @brief The append-only arena of blob records.
 * @ingroup CACHE
 * @details
 * A blob record is a 1-byte BlobTag, a 4-byte big-endian length, and the data, padded to
 * kBlobAlignment bytes. Records are immutable once written. Nothing is ever freed here,
 * so updates leave garbage behind until Compactor slides live records down.
 *
 * The pool's state is the pair of header fields (used, next-free), and
 * next-free == pool start + used holds at all times.
 * Bytes at and after next-free are always zero.
 *
 * This is a stateless wrapper around SegmentView. Construct it whenever needed.
 */
class BlobPool {
 public:
  /** Chunk size to zero-clear freed bytes. We never memset a whole pool at once. */
  static const uint64_t kZeroChunkSize = 1ULL << 13;

  explicit BlobPool(SegmentView* segment) : segment_(segment) {}

  /** Byte size of a record that holds data_length bytes. */
  static uint64_t get_record_size(uint64_t data_length) {
    return assorted::align8<uint64_t>(kBlobHeaderSize + data_length);
  }

  uint64_t    get_start() const;
  uint64_t    get_size() const;
  uint64_t    get_used() const;
  uint64_t    get_next() const;
  uint64_t    get_free() const { return get_size() - get_used(); }
  /** Whether records of the given total byte size can be appended now. */
  bool        has_room_for(uint64_t record_bytes) const { return record_bytes <= get_free(); }

  /**
   * @brief Appends a new record.
   * @param[in] tag type of the blob
   * @param[in] data the bytes to store
   * @param[in] length byte length of data
   * @param[out] address address of the new record
   * @return kErrorCodeCachePoolFull if the record doesn't fit. Nothing is written then.
   * kErrorCodeCacheTooLongBlob if length exceeds kMaxBlobLength.
   */
  ErrorCode   allocate(BlobTag tag, const void* data, uint64_t length, BlobAddress* address);

  /**
   * @brief Decodes and validates the record header at the given address.
   * @return kErrorCodeCacheCorruptBlob unless the address is 8-aligned, within the allocated
   * part of the pool, has a valid tag, and the whole record fits in the allocated part.
   * @details
   * This is the check for addresses coming from the tables. It never reads outside the pool.
   */
  ErrorCode   inspect(BlobAddress address, BlobRecord* out) const;

  /**
   * Reads the data of the record, which must have the expected tag.
   * @return kErrorCodeCacheCorruptBlob if inspect() fails or the tag differs.
   */
  ErrorCode   read(BlobAddress address, BlobTag expected_tag, std::string* out) const;

  /**
   * Compares the data of the record with the given bytes without copying it out.
   * @param[out] out whether the record has the expected tag and exactly the given bytes
   */
  ErrorCode   equals(
    BlobAddress address,
    BlobTag expected_tag,
    const void* data,
    uint64_t length,
    bool* out) const;

  /** Forgets all records and zero-clears the bytes they occupied. */
  void        reset();

  /**
   * @brief Sets the end of the allocated part, zero-clearing everything after it.
   * @pre get_start() <= new_next <= get_next()
   * @details
   * Used by Compactor after it moved all live records below new_next.
   */
  void        truncate(uint64_t new_next);

 private:
  SegmentView* const segment_;
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_BLOB_POOL_HPP_
