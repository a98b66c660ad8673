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
#include "cascache/cache/compactor.hpp"

#include <glog/logging.h>

#include <map>
#include <ostream>
#include <set>
#include <vector>

#include "cascache/assert_nd.hpp"
#include "cascache/cache/blob_pool.hpp"
#include "cascache/cache/key_table.hpp"
#include "cascache/cache/segment_layout.hpp"

namespace cascache {
namespace cache {

CompactionResult::CompactionResult()
  : live_blobs_(0),
    moved_blobs_(0),
    skipped_references_(0),
    dropped_keys_(0),
    dropped_contents_(0),
    relocated_contents_(false),
    used_before_(0),
    used_after_(0) {
}

std::ostream& operator<<(std::ostream& o, const CompactionResult& v) {
  o << "<CompactionResult>"
    << "<live_blobs_>" << v.live_blobs_ << "</live_blobs_>"
    << "<moved_blobs_>" << v.moved_blobs_ << "</moved_blobs_>"
    << "<skipped_references_>" << v.skipped_references_ << "</skipped_references_>"
    << "<dropped_keys_>" << v.dropped_keys_ << "</dropped_keys_>"
    << "<dropped_contents_>" << v.dropped_contents_ << "</dropped_contents_>"
    << "<relocated_contents_>" << v.relocated_contents_ << "</relocated_contents_>"
    << "<used_before_>" << v.used_before_ << "</used_before_>"
    << "<used_after_>" << v.used_after_ << "</used_after_>"
    << "</CompactionResult>";
  return o;
}

ErrorCode Compactor::compact(CompactionResult* result) {
  *result = CompactionResult();
  result->used_before_ = pool_->get_used();
  const uint64_t contents_before = content_table_->count_occupied();
  excluded_.clear();

  // mark. repeated until no two live blobs overlap, which only happens on corruption.
  do {
    mark(result);
  } while (exclude_overlaps(result));
  result->live_blobs_ = live_blobs_.size();
  ASSERT_ND(contents_before >= valid_contents_.size());
  result->dropped_contents_ = contents_before - valid_contents_.size();

  std::map<Hash128, SlotIndex> old_content_slots;
  for (const auto& content : valid_contents_) {
    SlotIndex slot = 0;
    content_table_->find(content.first, &slot);
    old_content_slots[content.first] = slot;
  }

  // copy
  std::map<BlobAddress, BlobAddress> relocation;
  uint64_t new_next = 0;
  copy(&relocation, &new_next);
  result->moved_blobs_ = 0;
  for (const auto& entry : relocation) {
    if (entry.first != entry.second) {
      ++result->moved_blobs_;
    }
  }

  // rewrite
  for (SlotIndex slot : live_keys_) {
    BlobAddress old_address = key_table_->get_key_address(slot);
    ASSERT_ND(relocation.find(old_address) != relocation.end());
    key_table_->set_key_address(slot, relocation[old_address]);
  }
  std::vector<ContentEntry> entries;
  entries.reserve(valid_contents_.size());
  for (const auto& content : valid_contents_) {
    ASSERT_ND(relocation.find(content.second) != relocation.end());
    entries.push_back(ContentEntry(content.first, relocation[content.second]));
  }
  CHECK_ERROR_CODE(content_table_->rebuild(&entries));
  for (const auto& content : old_content_slots) {
    SlotIndex slot = 0;
    bool found = content_table_->find(content.first, &slot);
    ASSERT_ND(found);
    UNUSED_ND(found);
    if (slot != content.second) {
      result->relocated_contents_ = true;
      break;
    }
  }

  pool_->truncate(new_next);
  result->used_after_ = pool_->get_used();

  if (result->is_changed()) {
    segment_->bump_segment_version();
  }
  valid_contents_.clear();
  live_keys_.clear();
  live_blobs_.clear();
  excluded_.clear();
  return kErrorCodeOk;
}

void Compactor::mark(CompactionResult* result) {
  valid_contents_.clear();
  live_keys_.clear();
  live_blobs_.clear();

  std::map<Hash128, BlobAddress> all_contents;
  for (SlotIndex slot = 0; slot < content_table_->get_capacity(); ++slot) {
    if (content_table_->is_occupied(slot)) {
      all_contents[content_table_->get_fingerprint(slot)] = content_table_->get_address(slot);
    }
  }

  std::set<Hash128> broken_contents;
  for (SlotIndex slot = 0; slot < key_table_->get_capacity(); ++slot) {
    if (key_table_->get_state(slot) != kKeySlotOccupied) {
      continue;
    }
    BlobAddress key_address = key_table_->get_key_address(slot);
    Hash128 fingerprint = key_table_->get_fingerprint(slot);

    BlobRecord key_record;
    if (excluded_.find(key_address) != excluded_.end()) {
      // already counted in exclude_overlaps()
      key_table_->tombstone(slot);
      ++result->dropped_keys_;
      continue;
    } else if (pool_->inspect(key_address, &key_record) != kErrorCodeOk
      || key_record.tag_ != kBlobTagKey) {
      LOG(WARNING) << "Skipped a broken key blob at " << key_address << " referred by key slot "
        << slot << ". The key is dropped.";
      ++result->skipped_references_;
      key_table_->tombstone(slot);
      ++result->dropped_keys_;
      continue;
    }

    if (valid_contents_.find(fingerprint) == valid_contents_.end()) {
      std::map<Hash128, BlobAddress>::const_iterator it = all_contents.find(fingerprint);
      bool valid = false;
      if (it == all_contents.end()) {
        LOG(WARNING) << "Key slot " << slot << " refers to fingerprint " << fingerprint
          << " which has no content entry. The key is dropped.";
        ++result->skipped_references_;
      } else if (broken_contents.find(fingerprint) != broken_contents.end()) {
        // already logged
      } else if (excluded_.find(it->second) != excluded_.end()) {
        broken_contents.insert(fingerprint);
      } else {
        BlobRecord content_record;
        if (pool_->inspect(it->second, &content_record) != kErrorCodeOk
          || content_record.tag_ != kBlobTagContent) {
          LOG(WARNING) << "Skipped a broken content blob at " << it->second
            << " of fingerprint " << fingerprint << ". Keys referring to it are dropped.";
          ++result->skipped_references_;
          broken_contents.insert(fingerprint);
        } else {
          valid_contents_[fingerprint] = it->second;
          live_blobs_[it->second] = content_record.get_record_size();
          valid = true;
        }
      }
      if (!valid) {
        key_table_->tombstone(slot);
        ++result->dropped_keys_;
        continue;
      }
    }

    live_keys_.push_back(slot);
    live_blobs_[key_address] = key_record.get_record_size();
  }
}

bool Compactor::exclude_overlaps(CompactionResult* result) {
  bool found = false;
  uint64_t previous_end = 0;
  for (const auto& blob : live_blobs_) {
    if (blob.first < previous_end) {
      LOG(WARNING) << "Skipped a blob at " << blob.first << " overlapping the previous one,"
        << " which ends at " << previous_end;
      ++result->skipped_references_;
      excluded_.insert(blob.first);
      found = true;
    } else {
      previous_end = blob.first + blob.second;
    }
  }
  return found;
}

void Compactor::copy(std::map<BlobAddress, BlobAddress>* relocation, uint64_t* new_next) {
  uint64_t next = pool_->get_start();
  for (const auto& blob : live_blobs_) {
    ASSERT_ND(blob.first >= next);
    if (blob.first != next) {
      VLOG(2) << "Moving a blob of " << blob.second << " bytes from " << blob.first
        << " to " << next;
      segment_->move_bytes(next, blob.first, blob.second);
    }
    (*relocation)[blob.first] = next;
    next += blob.second;
  }
  *new_next = next;
}

}  // namespace cache
}  // namespace cascache
