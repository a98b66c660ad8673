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
#ifndef CASCACHE_CACHE_HASH128_HPP_
#define CASCACHE_CACHE_HASH128_HPP_

#include <stdint.h>

#include <cstring>
#include <iosfwd>

#include "cascache/assorted/endianness.hpp"

/**
 * @file cascache/cache/hash128.hpp
 * @brief 128-bit digests used as key hashes and content fingerprints.
 * @ingroup CACHE
 */
namespace cascache {
namespace cache {

/**
 * @brief A 128-bit digest, stored as 16 big-endian bytes exactly as in the segment.
 * @ingroup CACHE
 * @details
 * POD. Comparison is bytewise, which is the same as comparing the big-endian 128-bit integers.
 */
struct Hash128 {
  uint8_t bytes_[16];

  static Hash128 zero() {
    Hash128 ret;
    std::memset(ret.bytes_, 0, sizeof(ret.bytes_));
    return ret;
  }
  /** The key table marks tombstones with this value. */
  static Hash128 all_ones() {
    Hash128 ret;
    std::memset(ret.bytes_, 0xFF, sizeof(ret.bytes_));
    return ret;
  }
  static Hash128 from_halves(uint64_t high, uint64_t low) {
    Hash128 ret;
    assorted::write_bigendian_unaligned<uint64_t>(high, ret.bytes_);
    assorted::write_bigendian_unaligned<uint64_t>(low, ret.bytes_ + 8);
    return ret;
  }

  uint64_t high() const { return assorted::read_bigendian_unaligned<uint64_t>(bytes_); }
  uint64_t low() const { return assorted::read_bigendian_unaligned<uint64_t>(bytes_ + 8); }

  bool is_zero() const { return high() == 0 && low() == 0; }
  bool is_all_ones() const { return high() == ~0ULL && low() == ~0ULL; }

  /** @returns this as a big-endian 128-bit integer, modulo the divisor. */
  uint64_t modulo(uint64_t divisor) const {
    __uint128_t value = (static_cast<__uint128_t>(high()) << 64) | low();
    return static_cast<uint64_t>(value % divisor);
  }

  bool operator==(const Hash128& other) const {
    return std::memcmp(bytes_, other.bytes_, sizeof(bytes_)) == 0;
  }
  bool operator!=(const Hash128& other) const { return !operator==(other); }
  bool operator<(const Hash128& other) const {
    return std::memcmp(bytes_, other.bytes_, sizeof(bytes_)) < 0;
  }

  friend std::ostream& operator<<(std::ostream& o, const Hash128& v);
};

/**
 * @brief Signature of a hash function that gives a 128-bit digest of arbitrary bytes.
 * @ingroup CACHE
 * @details
 * Every process attaching to a segment must use the same function, or lookups silently fail.
 * It is a plain function pointer rather than a functor because it is process-independent code.
 */
typedef Hash128 (*HashFunction)(const void* data, uint64_t length);

/** Seed of the XXH64 digest that makes the upper half. @ingroup CACHE */
const uint64_t kXxhashHighSeed = 0;
/** Seed of the XXH64 digest that makes the lower half. @ingroup CACHE */
const uint64_t kXxhashLowSeed = 1;

/**
 * @brief The default hash function.
 * @ingroup CACHE
 * @details
 * XXH64 with kXxhashHighSeed as the upper 64 bits and XXH64 with kXxhashLowSeed as the lower.
 * Fast and non-cryptographic. Don't use it where an adversary chooses the values.
 */
Hash128 default_hash_function(const void* data, uint64_t length);

/**
 * @brief Makes a digest usable as a key hash.
 * @ingroup CACHE
 * @details
 * All-zero and all-0xFF mean empty and tombstone in the key table, so a digest that happens
 * to be one of them is nudged to a neighbor. The key bytes are always compared after a hash
 * match, so this never causes a false hit.
 */
inline Hash128 to_key_hash(const Hash128& digest) {
  if (digest.is_zero()) {
    return Hash128::from_halves(0, 1);
  } else if (digest.is_all_ones()) {
    return Hash128::from_halves(~0ULL, ~1ULL);
  }
  return digest;
}

/**
 * @brief Makes a digest usable as a content fingerprint.
 * @ingroup CACHE
 * @details
 * Only all-zero is reserved in the content table. Unlike to_key_hash(), a nudged fingerprint
 * could collide with a real one, which is the same precision trade-off as any fingerprint
 * collision in the content table.
 */
inline Hash128 to_fingerprint(const Hash128& digest) {
  if (digest.is_zero()) {
    return Hash128::from_halves(0, 1);
  }
  return digest;
}

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_HASH128_HPP_
