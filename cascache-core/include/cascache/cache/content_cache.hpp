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
#ifndef CASCACHE_CACHE_CONTENT_CACHE_HPP_
#define CASCACHE_CACHE_CONTENT_CACHE_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <vector>

#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"
#include "cascache/error_stack.hpp"
#include "cascache/initializable.hpp"
#include "cascache/assorted/uniform_random.hpp"
#include "cascache/cache/blob_pool.hpp"
#include "cascache/cache/cache_options.hpp"
#include "cascache/cache/cache_stat.hpp"
#include "cascache/cache/compactor.hpp"
#include "cascache/cache/content_table.hpp"
#include "cascache/cache/fwd.hpp"
#include "cascache/cache/hash128.hpp"
#include "cascache/cache/key_table.hpp"
#include "cascache/cache/sampled_lru_evictor.hpp"
#include "cascache/cache/segment_layout.hpp"
#include "cascache/debugging/debugging_supports.hpp"
#include "cascache/memory/shared_memory.hpp"
#include "cascache/soc/fwd.hpp"

namespace cascache {
namespace cache {

/**
 * @brief A content-addressable key-value cache in a segment shared by processes.
 * @ingroup CACHE
 * @details
 * @par Lifecycle
 * initialize() creates or attaches the segment named by CacheOptions::segment_meta_path_,
 * depending on CacheOptions::open_mode_. The process that created the segment holds its
 * memory::OwnershipToken, and its uninitialize() (or close()) destroys the segment.
 * Other processes merely detach. Call uninitialize() explicitly. The destructor does it only as
 * a safety net.
 *
 * @par Lock
 * The application supplies the process-shared lock, typically placed in its own shared memory.
 * It must be initialized and recursive, otherwise initialize() fails with
 * kErrorCodeCacheMissingLock. Every operation acquires it, waiting at most
 * CacheOptions::lock_timeout_seconds_, and fails with kErrorCodeCacheLockTimeout without
 * modifying anything if the wait elapses. Operations of one process can nest in its own
 * critical section, as pop() does.
 *
 * @par Errors
 * Every operation returns an ErrorCode. kErrorCodeCacheKeyNotFound is a normal outcome of get()
 * and remove(), not a failure. Capacity errors (see is_capacity_error()) leave the cache
 * unchanged and are never retried internally. Compact or enlarge the cache.
 *
 * @par Example
 * @code{.cpp}
 * CacheOptions options;
 * options.maxsize_ = 10000;
 * options.segment_meta_path_ = "/tmp/my_cache";
 * ContentCache cache(options, lock_in_shared_memory);
 * CHECK_ERROR(cache.initialize());
 * WRAP_ERROR_CODE(cache.set("key", "value"));
 * std::string value;
 * ErrorCode ret = cache.get("key", &value);
 * CHECK_ERROR(cache.uninitialize());
 * @endcode
 */
class ContentCache CXX11_FINAL : public DefaultInitializable {
 public:
  /**
   * @param[in] options copied into this object
   * @param[in] lock process-shared recursive mutex that every process of the segment uses
   * @param[in] hash_function null for default_hash_function. Must be the same in all processes.
   */
  ContentCache(const CacheOptions& options, soc::SharedMutex* lock,
               HashFunction hash_function = CXX11_NULLPTR);
  ~ContentCache();

  // Disable default constructors
  ContentCache() CXX11_FUNC_DELETE;
  ContentCache(const ContentCache&) CXX11_FUNC_DELETE;
  ContentCache& operator=(const ContentCache&) CXX11_FUNC_DELETE;

  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /**
   * @brief Retrieves the value of the key and refreshes its last-access timestamp.
   * @return kErrorCodeCacheKeyNotFound if there is no such key
   */
  ErrorCode   get(const std::string& key, std::string* value);
  /** Same as get(), but gives default_value instead of kErrorCodeCacheKeyNotFound. */
  ErrorCode   get(const std::string& key, const std::string& default_value, std::string* value);

  /**
   * @brief Associates the value with the key, overwriting the current value if any.
   * @details
   * A value identical to a stored one is not stored again. When a new key arrives and the cache
   * already has maxsize items, one item is evicted first by SampledLruEvictor.
   * All capacity checks are done before anything is modified.
   * @return kErrorCodeCachePoolFull, kErrorCodeCacheContentTableFull,
   * kErrorCodeCacheKeyTableFull, kErrorCodeCacheTooLongBlob
   */
  ErrorCode   set(const std::string& key, const std::string& value);

  /**
   * @brief Deletes the key. The blobs stay in the pool until compact().
   * @return kErrorCodeCacheKeyNotFound if there is no such key
   */
  ErrorCode   remove(const std::string& key);

  /** Atomically retrieves and deletes the key. */
  ErrorCode   pop(const std::string& key, std::string* value);

  /** Doesn't refresh the timestamp nor count a hit or miss. */
  ErrorCode   contains(const std::string& key, bool* out);

  /** Number of items. */
  ErrorCode   get_item_count(uint64_t* out);

  /** All keys in the order of key table slots. */
  ErrorCode   keys(std::vector<std::string>* out);

  /**
   * @brief Removes everything, including garbage in the pool.
   * @details
   * Open cursors are invalidated. Hit and miss counters are kept.
   */
  ErrorCode   clear();

  /**
   * @brief Defragments the pool. See Compactor.
   * @param[out] result if not null, receives what the compaction did
   */
  ErrorCode   compact(CompactionResult* result = CXX11_NULLPTR);

  ErrorCode   get_stat(CacheStat* out);

  /**
   * @brief Checks every invariant of the segment.
   * @details
   * Expensive. Scans both tables and reads every referenced blob.
   * @return kErrorCodeCacheFailedVerification with a description of the first violation
   */
  ErrorStack  verify();

  /** Synonym of uninitialize(). */
  ErrorStack  close() { return uninitialize(); }

  const CacheOptions&   get_options() const { return options_; }
  HashFunction          get_hash_function() const { return hash_function_; }
  soc::SharedMutex*     get_lock() const { return lock_; }
  /** Whether this process created the segment and will destroy it. */
  bool                  is_owner() const { return memory_.is_owned(); }
  const memory::SharedMemory& get_memory() const { return memory_; }
  /** For testcases and tools that inspect the raw segment. Don't modify it without the lock. */
  SegmentView*          get_segment() { return &segment_; }

  friend std::ostream& operator<<(std::ostream& o, const ContentCache& v);

 private:
  friend class ContentCursor;

  const CacheOptions          options_;
  soc::SharedMutex* const     lock_;
  const HashFunction          hash_function_;
  debugging::DebuggingSupports  debugging_;

  memory::SharedMemory        memory_;
  SegmentView                 segment_;
  BlobPool                    pool_;
  KeyTable                    key_table_;
  ContentTable                content_table_;
  assorted::UniformRandom     random_;
  SampledLruEvictor           evictor_;
  Compactor                   compactor_;

  /** Creates or attaches the segment as options_.open_mode_ says. */
  ErrorStack  open_segment();
  ErrorStack  create_segment();
  ErrorStack  attach_segment();
  /** Waits for the creating process to publish the magic word, then validates the header. */
  ErrorStack  validate_attached_segment();

  uint64_t    get_lock_timeout_nanosec() const;
  /**
   * Acquires the cache lock within the timeout.
   * @return kErrorCodeNotInitialized or kErrorCodeCacheLockTimeout
   */
  ErrorCode   acquire_lock(soc::SharedMutexScope* scope) const;

  Hash128     hash_key(const std::string& key) const;
  Hash128     hash_value(const std::string& value) const;

  // _impl methods assume the lock is held.
  ErrorCode   get_impl(const std::string& key, std::string* value);
  ErrorCode   set_impl(const std::string& key, const std::string& value);
  ErrorCode   remove_impl(const std::string& key);
  ErrorStack  verify_impl();
};

}  // namespace cache
}  // namespace cascache

#endif  // CASCACHE_CACHE_CONTENT_CACHE_HPP_
