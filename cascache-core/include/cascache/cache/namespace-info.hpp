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
#ifndef CASCACHE_CACHE_NAMESPACE_INFO_HPP_
#define CASCACHE_CACHE_NAMESPACE_INFO_HPP_

/**
 * @namespace cascache::cache
 * @brief \b Content-addressable cache in a shared memory segment.
 * @details
 * @section CACHE_OVERVIEW Overview
 * A ContentCache maps arbitrary byte keys to arbitrary byte values, and stores each distinct
 * value only once no matter how many keys refer to it. All data lives in one fixed-size
 * segment shared by any number of processes. Every operation runs under one process-shared
 * lock supplied by the application, so operations from all processes are totally ordered.
 *
 * @section CACHE_LAYOUT Segment Layout
 * The segment consists of four disjoint regions in this order:
 *  \li Header (kHeaderSize bytes). Fixed-offset big-endian fields. See SegmentView.
 *  \li Blob Pool. An append-only arena of tagged, length-prefixed, 8-byte aligned records.
 *  \li Key Table. Open-addressing table of kKeyEntrySize-byte entries.
 *  \li Content Table. Open-addressing table of kContentEntrySize-byte entries.
 *
 * All integers in the segment are big-endian so that any tool can inspect the raw bytes.
 * Addresses are offsets from the beginning of the segment, hence valid in every process.
 *
 * @section CACHE_TABLES Two Tables
 * The key table maps the 128-bit hash of a key to the address of the key blob, the fingerprint
 * of the current value, and the last-access timestamp. A hash match is confirmed by comparing
 * the key bytes. Deleted slots become tombstones (hash of all 0xFF) because an all-zero slot
 * terminates probe chains.
 *
 * The content table maps the 128-bit fingerprint of a value to the address of the value blob.
 * Unlike the key table, fingerprint equality is taken as content equality without comparing
 * bytes. Two different values with the same 128-bit fingerprint would be conflated.
 * Content entries have no tombstones. They are reclaimed only by Compactor.
 *
 * @section CACHE_EVICTION Eviction and Compaction
 * When the number of items reaches maxsize, \e set evicts one item chosen by
 * SampledLruEvictor, an approximate LRU. Evicted and overwritten blobs remain in the pool as
 * garbage until the application calls \e compact, which slides live blobs down to the beginning
 * of the pool and rewrites addresses in both tables. Nothing is compacted automatically.
 */

/**
 * @defgroup CACHE Content-Addressable Cache
 * @copydoc cascache::cache
 */

#endif  // CASCACHE_CACHE_NAMESPACE_INFO_HPP_
