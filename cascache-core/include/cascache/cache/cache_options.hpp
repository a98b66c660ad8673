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
#ifndef CASCACHE_CACHE_CACHE_OPTIONS_HPP_
#define CASCACHE_CACHE_CACHE_OPTIONS_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>

#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"
#include "cascache/debugging/debugging_options.hpp"
#include "cascache/externalize/externalizable.hpp"

namespace cascache {
namespace cache {

/**
 * @brief Set of options for a content cache.
 * @ingroup CACHE
 * @details
 * This is a POD struct. Default destructor/copy-constructor/assignment operator work fine.
 *
 * Options that determine the geometry (maxsize, load factor, average sizes) matter only for the
 * process that creates the segment. Attaching processes read the geometry from the header.
 */
struct CacheOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /**
   * @brief How ContentCache::initialize() obtains the segment.
   */
  enum OpenMode {
    /** Allocate a new segment. Fails if a segment exists at segment_meta_path_. */
    kCreateNew = 0,
    /** Attach to the segment at segment_meta_path_. Fails if there is none. */
    kAttachExisting = 1,
    /** Attach if a segment exists, otherwise create it. Tolerates a concurrent creator. */
    kCreateOrAttach = 2,
  };

  /**
   * Constructs option values with default values.
   */
  CacheOptions();

  /**
   * @brief Validates the values without touching any segment.
   * @return a configuration error code, or kErrorCodeOk
   */
  ErrorCode validate() const;

  /**
   * @brief Maximum number of items in the cache.
   * @details
   * Required. Must be positive. There is no default.
   */
  int64_t     maxsize_;

  /**
   * @brief Fill threshold of the tables, in (0, 1].
   * @details
   * Each table has floor(maxsize / load_factor) slots. Default is 0.65.
   */
  double      load_factor_;

  /**
   * @brief Seconds to wait for the cache lock in every operation.
   * @details
   * Default is 60. kErrorCodeCacheLockTimeout if it elapses.
   * Must be finite and at most kMaxLockTimeoutSeconds.
   */
  double      lock_timeout_seconds_;

  /** Expected byte size of a key, to size the pool. Default is 200. */
  uint32_t    average_key_size_bytes_;
  /** Expected byte size of a value, to size the pool. Default is 2000. */
  uint32_t    average_value_size_bytes_;

  /** Number of occupied slots an eviction compares. Default is 10. */
  uint16_t    eviction_samples_;

  /**
   * @brief Seed of the random generator of eviction.
   * @details
   * Default is 0, which means a seed derived from the pid and the clock.
   */
  uint64_t    eviction_random_seed_;

  /**
   * @brief Path of the meta file that names the segment.
   * @details
   * Processes that agree on this path share the segment.
   * Default is "/tmp/cascache_segment".
   */
  std::string segment_meta_path_;

  /** Default is kCreateOrAttach. */
  OpenMode    open_mode_;

  /** NUMA node to allocate the segment on. Default is -1, no preference. */
  int16_t     numa_node_;

  /**
   * @brief Whether to allocate the segment from hugepages.
   * @details
   * Default is false. Requires vm.nr_hugepages to be configured.
   */
  bool        use_hugepages_;

  /** Options for glog. */
  debugging::DebuggingOptions debugging_;

  EXTERNALIZABLE(CacheOptions);
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_CACHE_OPTIONS_HPP_
