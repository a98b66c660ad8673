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
#include "cascache/cache/cache_options.hpp"

#include "cascache/cache/cache_id.hpp"
#include "cascache/externalize/externalizable.hpp"

namespace cascache {
namespace cache {

CacheOptions::CacheOptions()
  : maxsize_(0),
    load_factor_(kDefaultLoadFactor),
    lock_timeout_seconds_(kDefaultLockTimeoutSeconds),
    average_key_size_bytes_(kDefaultAverageKeySize),
    average_value_size_bytes_(kDefaultAverageValueSize),
    eviction_samples_(kDefaultEvictionSamples),
    eviction_random_seed_(0),
    segment_meta_path_("/tmp/cascache_segment"),
    open_mode_(kCreateOrAttach),
    numa_node_(-1),
    use_hugepages_(false) {
}

ErrorCode CacheOptions::validate() const {
  if (maxsize_ <= 0) {
    return kErrorCodeCacheInvalidMaxsize;
  }
  if (!(load_factor_ > 0.0 && load_factor_ <= 1.0)) {
    return kErrorCodeCacheInvalidLoadFactor;
  }
  // also rejects NaN and infinity
  if (!(lock_timeout_seconds_ >= 0.0 && lock_timeout_seconds_ <= kMaxLockTimeoutSeconds)
    || eviction_samples_ == 0
    || segment_meta_path_.empty()
    || (open_mode_ != kCreateNew && open_mode_ != kAttachExisting
      && open_mode_ != kCreateOrAttach)) {
    return kErrorCodeCacheInvalidOption;
  }
  return kErrorCodeOk;
}

ErrorStack CacheOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, maxsize_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, load_factor_, kDefaultLoadFactor);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, lock_timeout_seconds_, kDefaultLockTimeoutSeconds);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, average_key_size_bytes_, kDefaultAverageKeySize);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, average_value_size_bytes_, kDefaultAverageValueSize);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, eviction_samples_, kDefaultEvictionSamples);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, eviction_random_seed_, static_cast<uint64_t>(0));
  EXTERNALIZE_LOAD_ELEMENT(element, segment_meta_path_);
  EXTERNALIZE_LOAD_ENUM_ELEMENT_OPTIONAL(element, open_mode_, kCreateOrAttach);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, numa_node_, static_cast<int16_t>(-1));
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, use_hugepages_, false);
  CHECK_ERROR(get_child_element(element, "DebuggingOptions", &debugging_, true));

  ErrorCode validation = validate();
  if (validation != kErrorCodeOk) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, get_error_message(validation));
  }
  return kRetOk;
}

ErrorStack CacheOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for a content-addressable cache.\n"
    " enum OpenMode: How the segment is obtained\n"
    " kCreateNew = 0: Allocate a new segment. Fails if it exists.\n"
    " kAttachExisting = 1: Attach to an existing segment. Fails if there is none.\n"
    " kCreateOrAttach = 2: Attach if a segment exists, otherwise create it."));

  EXTERNALIZE_SAVE_ELEMENT(element, maxsize_, "Maximum number of items in the cache");
  EXTERNALIZE_SAVE_ELEMENT(element, load_factor_, "Fill threshold of the tables, in (0, 1]");
  EXTERNALIZE_SAVE_ELEMENT(element, lock_timeout_seconds_,
    "Seconds to wait for the cache lock in every operation");
  EXTERNALIZE_SAVE_ELEMENT(element, average_key_size_bytes_,
    "Expected byte size of a key, to size the pool");
  EXTERNALIZE_SAVE_ELEMENT(element, average_value_size_bytes_,
    "Expected byte size of a value, to size the pool");
  EXTERNALIZE_SAVE_ELEMENT(element, eviction_samples_,
    "Number of occupied slots an eviction compares");
  EXTERNALIZE_SAVE_ELEMENT(element, eviction_random_seed_,
    "Seed of the random generator of eviction. 0 to derive it from the pid and the clock");
  EXTERNALIZE_SAVE_ELEMENT(element, segment_meta_path_,
    "Path of the meta file that names the segment");
  EXTERNALIZE_SAVE_ENUM_ELEMENT(element, open_mode_, "How the segment is obtained");
  EXTERNALIZE_SAVE_ELEMENT(element, numa_node_,
    "NUMA node to allocate the segment on. -1 for no preference");
  EXTERNALIZE_SAVE_ELEMENT(element, use_hugepages_,
    "Whether to allocate the segment from hugepages");
  CHECK_ERROR(add_child_element(element, "DebuggingOptions", debugging_));
  return kRetOk;
}

}  // namespace cache
}  // namespace cascache
