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
#ifndef CASCACHE_NAMESPACE_INFO_HPP_
#define CASCACHE_NAMESPACE_INFO_HPP_

/**
 * @namespace cascache
 * @brief Root package of \b cascache, a content-addressable cache shared by processes.
 * @details
 * cascache keeps a key-value cache in one fixed-size shared memory segment that any number of
 * processes on the same host attach to. Identical values are stored once (deduplicated by
 * a 128-bit content fingerprint), the number of keys is bounded by an approximate LRU,
 * and the blob arena is defragmented on demand.
 *
 * Start from cascache::cache::ContentCache.
 */

/**
 * @defgroup IDIOMS Coding Idioms
 * @brief Error handling, initialization and other idioms used throughout the library.
 */

#endif  // CASCACHE_NAMESPACE_INFO_HPP_
