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
#include "cascache/cache/content_cache.hpp"

#include <glog/logging.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "cascache/assert_nd.hpp"
#include "cascache/assorted/assorted_func.hpp"
#include "cascache/assorted/atomic_fences.hpp"
#include "cascache/debugging/stop_watch.hpp"
#include "cascache/fs/filesystem.hpp"
#include "cascache/soc/shared_mutex.hpp"

namespace cascache {
namespace cache {

namespace {
uint64_t derive_seed(uint64_t configured) {
  if (configured != 0) {
    return configured;
  }
  return debugging::get_now_nanosec() ^ (static_cast<uint64_t>(::getpid()) << 32);
}
}  // anonymous namespace

ContentCache::ContentCache(
  const CacheOptions& options,
  soc::SharedMutex* lock,
  HashFunction hash_function)
  : options_(options),
    lock_(lock),
    hash_function_(hash_function ? hash_function : default_hash_function),
    debugging_(options.debugging_),
    pool_(&segment_),
    key_table_(&segment_, &pool_),
    content_table_(&segment_),
    random_(derive_seed(options.eviction_random_seed_)),
    evictor_(&key_table_, &random_, options.eviction_samples_),
    compactor_(&segment_, &pool_, &key_table_, &content_table_) {
}

ContentCache::~ContentCache() {
  if (is_initialized()) {
    LOG(WARNING) << "ContentCache of " << options_.segment_meta_path_ << " was not closed"
      << " before destruction. Closing it now.";
    ErrorStack error = uninitialize();
    if (error.is_error()) {
      LOG(ERROR) << "Failed to close ContentCache in destructor: " << error;
    }
  }
}

ErrorStack ContentCache::initialize_once() {
  CHECK_ERROR(debugging_.initialize());
  ErrorStack ret = open_segment();
  if (ret.is_error()) {
    LOG(ERROR) << "Failed to open the cache segment at " << options_.segment_meta_path_ << ". "
      << ret;
    // this object stays uninitialized, so nobody else would release glog.
    CHECK_ERROR(debugging_.uninitialize());
  }
  return ret;
}

ErrorStack ContentCache::open_segment() {
  WRAP_ERROR_CODE(options_.validate());
  if (lock_ == CXX11_NULLPTR || !lock_->is_initialized() || !lock_->is_recursive()) {
    return ERROR_STACK(kErrorCodeCacheMissingLock);
  }

  const std::string& meta_path = options_.segment_meta_path_;
  switch (options_.open_mode_) {
  case CacheOptions::kCreateNew:
    CHECK_ERROR(create_segment());
    break;
  case CacheOptions::kAttachExisting:
    CHECK_ERROR(attach_segment());
    break;
  default: {
    ASSERT_ND(options_.open_mode_ == CacheOptions::kCreateOrAttach);
    if (fs::exists(fs::Path(meta_path))) {
      CHECK_ERROR(attach_segment());
      break;
    }
    ErrorStack create_error = create_segment();
    if (!create_error.is_error()) {
      break;
    } else if (!fs::exists(fs::Path(meta_path))) {
      return create_error;
    }
    // another process created it in the meantime
    LOG(INFO) << "Another process has just created " << meta_path << ". Attaching to it.";
    CHECK_ERROR(attach_segment());
    break;
  }
  }
  return kRetOk;
}

ErrorStack ContentCache::create_segment() {
  SegmentGeometry geometry;
  WRAP_ERROR_CODE(SegmentGeometry::compute(
    static_cast<uint64_t>(options_.maxsize_),
    options_.load_factor_,
    options_.average_key_size_bytes_,
    options_.average_value_size_bytes_,
    &geometry));
  CHECK_ERROR(memory_.alloc(
    options_.segment_meta_path_,
    geometry.total_size_,
    options_.numa_node_,
    options_.use_hugepages_));
  segment_ = SegmentView(memory_.get_block(), memory_.get_size());
  segment_.format(geometry);
  LOG(INFO) << "Created a cache segment at " << options_.segment_meta_path_ << ". "
    << geometry << memory_;
  return kRetOk;
}

ErrorStack ContentCache::attach_segment() {
  CHECK_ERROR(memory_.attach(options_.segment_meta_path_));
  segment_ = SegmentView(memory_.get_block(), memory_.get_size());
  ErrorStack validation = validate_attached_segment();
  if (validation.is_error()) {
    segment_ = SegmentView();
    memory_.release_block();
    return validation;
  }
  LOG(INFO) << "Attached to a cache segment at " << options_.segment_meta_path_ << ". "
    << segment_;
  return kRetOk;
}

ErrorStack ContentCache::validate_attached_segment() {
  if (segment_.get_mapped_size() < kHeaderSize) {
    return ERROR_STACK_MSG(kErrorCodeCacheCorruptHeader, "The segment is smaller than a header");
  }
  const uint64_t timeout = get_lock_timeout_nanosec();
  debugging::StopWatch watch;
  while (segment_.get_magic() == 0 && watch.peek_elapsed_ns() < timeout) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  assorted::memory_fence_acquire();

  // the geometry is immutable, but pool and item counters might be in the middle of a change.
  soc::SharedMutexScope scope(lock_, false);
  if (!scope.timedlock(timeout)) {
    return ERROR_STACK(kErrorCodeCacheLockTimeout);
  }
  ErrorCode validation = segment_.validate();
  if (validation != kErrorCodeOk) {
    std::stringstream msg;
    msg << "Attached segment is not a valid cache segment. " << segment_;
    std::string str = msg.str();
    return ERROR_STACK_MSG(validation, str.c_str());
  }
  return kRetOk;
}

ErrorStack ContentCache::uninitialize_once() {
  if (!memory_.is_null()) {
    if (memory_.is_owned()) {
      LOG(INFO) << "Destroying the cache segment at " << options_.segment_meta_path_;
    } else {
      LOG(INFO) << "Detaching from the cache segment at " << options_.segment_meta_path_;
    }
  }
  segment_ = SegmentView();
  memory_.release_block();
  CHECK_ERROR(debugging_.uninitialize());
  return kRetOk;
}

uint64_t ContentCache::get_lock_timeout_nanosec() const {
  return static_cast<uint64_t>(options_.lock_timeout_seconds_ * 1000000000.0);
}

ErrorCode ContentCache::acquire_lock(soc::SharedMutexScope* scope) const {
  if (!is_initialized()) {
    return kErrorCodeNotInitialized;
  }
  if (!scope->timedlock(get_lock_timeout_nanosec())) {
    LOG(WARNING) << "Timed out while acquiring the lock of " << options_.segment_meta_path_
      << " for " << options_.lock_timeout_seconds_ << " seconds";
    return kErrorCodeCacheLockTimeout;
  }
  return kErrorCodeOk;
}

Hash128 ContentCache::hash_key(const std::string& key) const {
  return to_key_hash(hash_function_(key.data(), key.size()));
}

Hash128 ContentCache::hash_value(const std::string& value) const {
  return to_fingerprint(hash_function_(value.data(), value.size()));
}

ErrorCode ContentCache::get(const std::string& key, std::string* value) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  return get_impl(key, value);
}

ErrorCode ContentCache::get(
  const std::string& key,
  const std::string& default_value,
  std::string* value) {
  ErrorCode ret = get(key, value);
  if (ret == kErrorCodeCacheKeyNotFound) {
    *value = default_value;
    return kErrorCodeOk;
  }
  return ret;
}

ErrorCode ContentCache::get_impl(const std::string& key, std::string* value) {
  SlotIndex slot;
  ErrorCode find_ret = key_table_.find(hash_key(key), key.data(), key.size(), &slot);
  if (find_ret == kErrorCodeCacheKeyNotFound) {
    segment_.increment_misses();
    return kErrorCodeCacheKeyNotFound;
  }
  CHECK_ERROR_CODE(find_ret);

  Hash128 fingerprint = key_table_.get_fingerprint(slot);
  SlotIndex content_slot;
  if (!content_table_.find(fingerprint, &content_slot)) {
    LOG(ERROR) << "Key slot " << slot << " refers to fingerprint " << fingerprint
      << " which has no content entry";
    return kErrorCodeCacheDanglingFingerprint;
  }
  CHECK_ERROR_CODE(pool_.read(content_table_.get_address(content_slot), kBlobTagContent, value));
  key_table_.touch(slot, debugging::get_now_nanosec());
  segment_.increment_hits();
  return kErrorCodeOk;
}

ErrorCode ContentCache::set(const std::string& key, const std::string& value) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  return set_impl(key, value);
}

ErrorCode ContentCache::set_impl(const std::string& key, const std::string& value) {
  if (key.size() > kMaxBlobLength || value.size() > kMaxBlobLength) {
    return kErrorCodeCacheTooLongBlob;
  }
  const Hash128 key_hash = hash_key(key);
  const Hash128 fingerprint = hash_value(value);

  SlotIndex key_slot = 0;
  ErrorCode find_ret = key_table_.find(key_hash, key.data(), key.size(), &key_slot);
  if (find_ret != kErrorCodeOk && find_ret != kErrorCodeCacheKeyNotFound) {
    return find_ret;
  }
  const bool key_exists = (find_ret == kErrorCodeOk);

  SlotIndex content_slot = 0;
  const bool content_exists = content_table_.find(fingerprint, &content_slot);

  // check every capacity before modifying anything
  uint64_t required = 0;
  if (!key_exists) {
    required += BlobPool::get_record_size(key.size());
  }
  if (!content_exists) {
    required += BlobPool::get_record_size(value.size());
    CHECK_ERROR_CODE(content_table_.find_empty(fingerprint, &content_slot));
  }
  if (!pool_.has_room_for(required)) {
    LOG(WARNING) << "The pool of " << options_.segment_meta_path_ << " is full. required="
      << required << ", free=" << pool_.get_free() << ". Compact or enlarge the cache.";
    return kErrorCodeCachePoolFull;
  }
  const bool at_capacity = key_table_.get_item_count() >= key_table_.get_max_items();
  if (!key_exists) {
    if (at_capacity && !evictor_.evict()) {
      // the evictor has already logged it. nothing has been modified.
      return kErrorCodeCacheKeyTableFull;
    }
    CHECK_ERROR_CODE(key_table_.find_empty_or_tombstone(key_hash, &key_slot));
  }

  if (!content_exists) {
    BlobAddress content_address;
    CHECK_ERROR_CODE(pool_.allocate(kBlobTagContent, value.data(), value.size(), &content_address));
    content_table_.install(content_slot, fingerprint, content_address);
  }

  const uint64_t now = debugging::get_now_nanosec();
  if (key_exists) {
    key_table_.set_fingerprint(key_slot, fingerprint);
    key_table_.touch(key_slot, now);
    return kErrorCodeOk;
  }

  BlobAddress key_address;
  CHECK_ERROR_CODE(pool_.allocate(kBlobTagKey, key.data(), key.size(), &key_address));
  key_table_.install(key_slot, key_hash, key_address, fingerprint, now);
  ASSERT_ND(key_table_.get_item_count() <= key_table_.get_max_items());
  return kErrorCodeOk;
}

ErrorCode ContentCache::remove(const std::string& key) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  return remove_impl(key);
}

ErrorCode ContentCache::remove_impl(const std::string& key) {
  SlotIndex slot;
  CHECK_ERROR_CODE(key_table_.find(hash_key(key), key.data(), key.size(), &slot));
  key_table_.tombstone(slot);
  return kErrorCodeOk;
}

ErrorCode ContentCache::pop(const std::string& key, std::string* value) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  // both re-enter the lock we are holding
  CHECK_ERROR_CODE(get(key, value));
  CHECK_ERROR_CODE(remove(key));
  return kErrorCodeOk;
}

ErrorCode ContentCache::contains(const std::string& key, bool* out) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  SlotIndex slot;
  ErrorCode ret = key_table_.find(hash_key(key), key.data(), key.size(), &slot);
  if (ret == kErrorCodeCacheKeyNotFound) {
    *out = false;
    return kErrorCodeOk;
  }
  CHECK_ERROR_CODE(ret);
  *out = true;
  return kErrorCodeOk;
}

ErrorCode ContentCache::get_item_count(uint64_t* out) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  *out = key_table_.get_item_count();
  return kErrorCodeOk;
}

ErrorCode ContentCache::keys(std::vector<std::string>* out) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  out->clear();
  out->reserve(key_table_.get_item_count());
  for (SlotIndex slot = 0; slot < key_table_.get_capacity(); ++slot) {
    if (key_table_.get_state(slot) != kKeySlotOccupied) {
      continue;
    }
    std::string key;
    CHECK_ERROR_CODE(pool_.read(key_table_.get_key_address(slot), kBlobTagKey, &key));
    out->push_back(key);
  }
  return kErrorCodeOk;
}

ErrorCode ContentCache::clear() {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  key_table_.clear_all();
  content_table_.clear_all();
  pool_.reset();
  segment_.bump_segment_version();
  VLOG(0) << "Cleared the cache segment at " << options_.segment_meta_path_;
  return kErrorCodeOk;
}

ErrorCode ContentCache::compact(CompactionResult* result) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  CompactionResult local_result;
  debugging::StopWatch watch;
  CHECK_ERROR_CODE(compactor_.compact(&local_result));
  watch.stop();
  VLOG(0) << "Compacted the cache segment at " << options_.segment_meta_path_ << " in "
    << watch.elapsed_us() << "us. " << local_result;
  if (local_result.skipped_references_ > 0) {
    LOG(WARNING) << "Compaction skipped " << local_result.skipped_references_
      << " broken references and dropped " << local_result.dropped_keys_ << " keys";
  }
  if (result) {
    *result = local_result;
  }
  return kErrorCodeOk;
}

ErrorCode ContentCache::get_stat(CacheStat* out) {
  soc::SharedMutexScope scope(lock_, false);
  CHECK_ERROR_CODE(acquire_lock(&scope));
  out->item_count_ = key_table_.get_item_count();
  out->max_items_ = segment_.get_max_items();
  out->key_table_capacity_ = key_table_.get_capacity();
  out->content_table_capacity_ = content_table_.get_capacity();
  out->occupied_key_slots_ = key_table_.count_occupied();
  out->tombstone_key_slots_ = key_table_.count_tombstones();
  out->content_entries_ = content_table_.count_occupied();
  out->pool_size_ = pool_.get_size();
  out->pool_used_ = pool_.get_used();
  out->hits_ = segment_.get_hits();
  out->misses_ = segment_.get_misses();
  out->segment_version_ = segment_.get_segment_version();
  return kErrorCodeOk;
}

ErrorStack ContentCache::verify() {
  soc::SharedMutexScope scope(lock_, false);
  WRAP_ERROR_CODE(acquire_lock(&scope));
  return verify_impl();
}

ErrorStack ContentCache::verify_impl() {
  ErrorCode header = segment_.validate();
  if (header != kErrorCodeOk) {
    return ERROR_STACK_MSG(kErrorCodeCacheFailedVerification, get_error_message(header));
  }

  std::map<BlobAddress, uint64_t> blobs;
  std::map<Hash128, BlobAddress> contents;
  for (SlotIndex slot = 0; slot < content_table_.get_capacity(); ++slot) {
    if (!content_table_.is_occupied(slot)) {
      continue;
    }
    Hash128 fingerprint = content_table_.get_fingerprint(slot);
    BlobRecord record;
    if (pool_.inspect(content_table_.get_address(slot), &record) != kErrorCodeOk
      || record.tag_ != kBlobTagContent) {
      std::stringstream msg;
      msg << "Content slot " << slot << " refers to a broken blob at "
        << content_table_.get_address(slot);
      std::string str = msg.str();
      return ERROR_STACK_MSG(kErrorCodeCacheFailedVerification, str.c_str());
    }
    if (contents.find(fingerprint) != contents.end()) {
      std::stringstream msg;
      msg << "Fingerprint " << fingerprint << " appears twice in the content table";
      std::string str = msg.str();
      return ERROR_STACK_MSG(kErrorCodeCacheFailedVerification, str.c_str());
    }
    contents[fingerprint] = record.address_;
    blobs[record.address_] = record.get_record_size();
  }

  uint64_t occupied = 0;
  for (SlotIndex slot = 0; slot < key_table_.get_capacity(); ++slot) {
    if (key_table_.get_state(slot) != kKeySlotOccupied) {
      continue;
    }
    ++occupied;
    std::stringstream msg;
    std::string key;
    if (pool_.read(key_table_.get_key_address(slot), kBlobTagKey, &key) != kErrorCodeOk) {
      msg << "Key slot " << slot << " refers to a broken blob at "
        << key_table_.get_key_address(slot);
    } else if (hash_key(key) != key_table_.get_hash(slot)) {
      msg << "Key slot " << slot << " has a hash different from its key "
        << assorted::HexString(key, 32);
    } else if (contents.find(key_table_.get_fingerprint(slot)) == contents.end()) {
      msg << "Key slot " << slot << " refers to fingerprint " << key_table_.get_fingerprint(slot)
        << " which has no content entry";
    } else if (blobs.find(key_table_.get_key_address(slot)) != blobs.end()) {
      msg << "Key slot " << slot << " shares its key blob with another entry";
    } else {
      blobs[key_table_.get_key_address(slot)] = BlobPool::get_record_size(key.size());
      continue;
    }
    std::string str = msg.str();
    return ERROR_STACK_MSG(kErrorCodeCacheFailedVerification, str.c_str());
  }
  if (occupied != key_table_.get_item_count() || occupied > key_table_.get_max_items()) {
    std::stringstream msg;
    msg << "Item count is " << key_table_.get_item_count() << " while " << occupied
      << " slots are occupied. max=" << key_table_.get_max_items();
    std::string str = msg.str();
    return ERROR_STACK_MSG(kErrorCodeCacheFailedVerification, str.c_str());
  }

  uint64_t previous_end = 0;
  for (const auto& blob : blobs) {
    if (blob.first < previous_end) {
      std::stringstream msg;
      msg << "Blob at " << blob.first << " overlaps the previous one ending at " << previous_end;
      std::string str = msg.str();
      return ERROR_STACK_MSG(kErrorCodeCacheFailedVerification, str.c_str());
    }
    previous_end = blob.first + blob.second;
  }
  return kRetOk;
}

std::ostream& operator<<(std::ostream& o, const ContentCache& v) {
  o << "<ContentCache>"
    << "<segment_meta_path_>" << v.options_.segment_meta_path_ << "</segment_meta_path_>"
    << "<initialized>" << v.is_initialized() << "</initialized>"
    << "<owner>" << v.is_owner() << "</owner>";
  if (v.is_initialized()) {
    o << v.segment_;
  }
  o << "</ContentCache>";
  return o;
}

}  // namespace cache
}  // namespace cascache
