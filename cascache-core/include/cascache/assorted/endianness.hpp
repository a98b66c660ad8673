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
#ifndef CASCACHE_ASSORTED_ENDIANNESS_HPP_
#define CASCACHE_ASSORTED_ENDIANNESS_HPP_

#include <endian.h>
#include <stdint.h>

#include <cstring>

#include "cascache/compiler.hpp"

/**
 * @file cascache/assorted/endianness.hpp
 * @ingroup ASSORTED
 * @brief Conversion between host integers and the big-endian integers in the shared segment.
 * @details
 * Every integer in the segment (header fields, table entries, blob lengths) is big-endian,
 * regardless of the host. Hashes are compared as big-endian 128-bit integers, too.
 */

namespace cascache {
namespace assorted {

/**
 * @brief A handy const boolean to tell if it's little endian.
 * @ingroup ASSORTED
 */
#if (__BYTE_ORDER == __LITTLE_ENDIAN)
const bool kIsLittleEndian = true;
#elif __BYTE_ORDER == __BIG_ENDIAN
const bool kIsLittleEndian = false;
#else  // __BYTE_ORDER == __BIG_ENDIAN
#error "__BYTE_ORDER is neither __LITTLE_ENDIAN nor __BIG_ENDIAN."
#endif  // __BYTE_ORDER

// remember these are macros. we can't say "::be64toh"
template <typename T> T betoh(T be_value);
template <> inline uint64_t betoh<uint64_t>(uint64_t be_value) { return be64toh(be_value); }
template <> inline uint32_t betoh<uint32_t>(uint32_t be_value) { return be32toh(be_value); }
template <> inline uint16_t betoh<uint16_t>(uint16_t be_value) { return be16toh(be_value); }
template <> inline uint8_t betoh<uint8_t>(uint8_t be_value) { return be_value; }

template <typename T> T htobe(T host_value);
template <> inline uint64_t htobe<uint64_t>(uint64_t host_value) { return htobe64(host_value); }
template <> inline uint32_t htobe<uint32_t>(uint32_t host_value) { return htobe32(host_value); }
template <> inline uint16_t htobe<uint16_t>(uint16_t host_value) { return htobe16(host_value); }
template <> inline uint8_t htobe<uint8_t>(uint8_t host_value) { return host_value; }

/**
 * @brief Convert a big-endian byte array to a native unsigned integer.
 * @param[in] be_bytes a big-endian byte array. MUST BE ALIGNED to sizeof(T).
 * @ingroup ASSORTED
 */
template <typename T>
inline T read_bigendian(const void* be_bytes) {
  const T* be_address = reinterpret_cast<const T*>(ASSUME_ALIGNED(be_bytes, sizeof(T)));
  T be_value = *be_address;
  return betoh<T>(be_value);
}

/**
 * @brief Convert a native unsigned integer to big-endian bytes and write them.
 * @param[in] host_value a native integer.
 * @param[out] be_bytes address to write out big endian bytes. MUST BE ALIGNED to sizeof(T).
 * @ingroup ASSORTED
 */
template <typename T>
inline void write_bigendian(T host_value, void* be_bytes) {
  T* be_address = reinterpret_cast<T*>(ASSUME_ALIGNED(be_bytes, sizeof(T)));
  *be_address = htobe<T>(host_value);
}

/**
 * @brief Same as read_bigendian() for an address that might not be aligned.
 * @ingroup ASSORTED
 * @details
 * The 4-byte length of a blob record sits right after the 1-byte tag, so it is never aligned.
 */
template <typename T>
inline T read_bigendian_unaligned(const void* be_bytes) {
  T be_value;
  std::memcpy(&be_value, be_bytes, sizeof(T));
  return betoh<T>(be_value);
}

/** @copydoc read_bigendian_unaligned() */
template <typename T>
inline void write_bigendian_unaligned(T host_value, void* be_bytes) {
  T be_value = htobe<T>(host_value);
  std::memcpy(be_bytes, &be_value, sizeof(T));
}

}  // namespace assorted
}  // namespace cascache

#endif  // CASCACHE_ASSORTED_ENDIANNESS_HPP_
