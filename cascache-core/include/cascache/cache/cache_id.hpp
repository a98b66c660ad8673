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
#ifndef CASCACHE_CACHE_CACHE_ID_HPP_
#define CASCACHE_CACHE_CACHE_ID_HPP_

#include <stdint.h>

#include "cascache/error_code.hpp"

/**
 * @file cascache/cache/cache_id.hpp
 * @brief Definitions of IDs, constants and binary offsets in the cache package.
 * @ingroup CACHE
 */
namespace cascache {
namespace cache {

/**
 * @brief Offset of a blob record from the beginning of the segment.
 * @ingroup CACHE
 * @details
 * The header occupies the first kHeaderSize bytes, so 0 is never a valid blob address.
 */
typedef uint64_t BlobAddress;

/**
 * @brief Index of a slot in the key table or the content table.
 * @ingroup CACHE
 */
typedef uint64_t SlotIndex;

/** @ingroup CACHE */
const BlobAddress kNullBlobAddress = 0;

/**
 * @brief Upper 48 bits of the magic word at offset 0.
 * @ingroup CACHE
 */
const uint64_t kMagicBase = 0x4AB866393C4D0000ULL;
/** @ingroup CACHE */
const uint64_t kMagicBaseMask = 0xFFFFFFFFFFFF0000ULL;
/**
 * @brief Version of the binary format. Lower 16 bits of the magic word.
 * @ingroup CACHE
 */
const uint16_t kFormatVersion = 1;
/** @ingroup CACHE */
const uint64_t kMagic = kMagicBase | kFormatVersion;

/** Byte size of the segment header. @ingroup CACHE */
const uint64_t kHeaderSize = 512;

/** @ingroup CACHE */
const uint32_t kBlobAlignment = 8;
/** tag(1) + big-endian length(4). @ingroup CACHE */
const uint32_t kBlobHeaderSize = 5;
/** The length field of a blob record is 32 bits. @ingroup CACHE */
const uint64_t kMaxBlobLength = 0xFFFFFFFFULL;

/**
 * @brief Type tag of a blob record.
 * @ingroup CACHE
 */
enum BlobTag {
  /** Zero-cleared bytes. Never a valid record. */
  kBlobTagNone = 0,
  kBlobTagKey = 1,
  kBlobTagContent = 2,
};

/** @ingroup CACHE */
const uint32_t kKeyEntrySize = 48;
/** @ingroup CACHE */
const uint32_t kContentEntrySize = 24;

/**
 * @brief Maximum number of slots in either table.
 * @ingroup CACHE
 * @details
 * The evictor draws slot indexes with 32-bit random numbers.
 */
const uint64_t kMaxSlots = 0x7FFFFFFFULL;

/**
 * @brief State of a key table slot, derived from its hash.
 * @ingroup CACHE
 */
enum KeySlotState {
  /** All-zero hash. Never occupied. Terminates probe chains. */
  kKeySlotEmpty = 0,
  /** All-0xFF hash. Previously occupied. Probing continues past it. */
  kKeySlotTombstone,
  /** Any other hash. */
  kKeySlotOccupied,
};

const double    kDefaultLoadFactor = 0.65;
const double    kDefaultLockTimeoutSeconds = 60.0;
/** Longest lock wait accepted. Keeps the nanosecond conversion within 64 bits. */
const double    kMaxLockTimeoutSeconds = 1.0e9;
const uint32_t  kDefaultAverageKeySize = 200;
const uint32_t  kDefaultAverageValueSize = 2000;
const uint16_t  kDefaultEvictionSamples = 10;

/**
 * @name Header Offsets
 * Offsets of the big-endian header fields.
 * @ingroup CACHE
 */
/// @{
const uint32_t kHeaderOffsetMagic = 0;
const uint32_t kHeaderOffsetFormatVersion = 8;
const uint32_t kHeaderOffsetSegmentVersion = 12;
const uint32_t kHeaderOffsetTotalSize = 16;
const uint32_t kHeaderOffsetPoolStart = 24;
const uint32_t kHeaderOffsetPoolSize = 32;
const uint32_t kHeaderOffsetPoolUsed = 40;
const uint32_t kHeaderOffsetPoolNext = 48;
const uint32_t kHeaderOffsetKeyTableStart = 56;
const uint32_t kHeaderOffsetKeyTableCapacity = 64;
const uint32_t kHeaderOffsetContentTableStart = 72;
const uint32_t kHeaderOffsetContentTableCapacity = 80;
const uint32_t kHeaderOffsetMaxItems = 88;
const uint32_t kHeaderOffsetItemCount = 96;
const uint32_t kHeaderOffsetHits = 104;
const uint32_t kHeaderOffsetMisses = 112;
/// @}

/**
 * @name Entry Offsets
 * Offsets of the fields in a key entry and a content entry.
 * @ingroup CACHE
 */
/// @{
const uint32_t kKeyEntryOffsetHash = 0;
const uint32_t kKeyEntryOffsetKeyAddress = 16;
const uint32_t kKeyEntryOffsetFingerprint = 24;
const uint32_t kKeyEntryOffsetTimestamp = 40;
const uint32_t kContentEntryOffsetFingerprint = 0;
const uint32_t kContentEntryOffsetAddress = 16;
/// @}

/**
 * @brief Whether the error is a configuration error, which is never recovered.
 * @ingroup CACHE
 */
inline bool is_configuration_error(ErrorCode code) {
  return get_error_group(code) == kErrorGroupCacheSetup;
}

/**
 * @brief Whether the error is a capacity exhaustion.
 * @ingroup CACHE
 * @details
 * The cache never grows itself. Compact it, enlarge maxsize, or reduce the load.
 */
inline bool is_capacity_error(ErrorCode code) {
  return code == kErrorCodeCacheKeyTableFull
    || code == kErrorCodeCacheContentTableFull
    || code == kErrorCodeCachePoolFull;
}

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_CACHE_ID_HPP_
