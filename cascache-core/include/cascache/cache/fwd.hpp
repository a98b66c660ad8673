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
#ifndef CASCACHE_CACHE_FWD_HPP_
#define CASCACHE_CACHE_FWD_HPP_

/**
 * @file cascache/cache/fwd.hpp
 * @brief Forward declarations of classes in cache package.
 * @ingroup CACHE
 */
namespace cascache {
namespace cache {
class   BlobPool;
struct  BlobRecord;
struct  CacheOptions;
struct  CacheStat;
struct  CompactionResult;
class   Compactor;
class   ContentCache;
class   ContentCursor;
class   ContentTable;
struct  Hash128;
class   KeyTable;
class   SampledLruEvictor;
struct  SegmentGeometry;
class   SegmentView;
}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_FWD_HPP_
