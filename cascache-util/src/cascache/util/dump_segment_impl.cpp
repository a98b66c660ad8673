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
#include <stdint.h>

#include <iostream>
#include <string>

#include "cascache/error_code.hpp"
#include "cascache/error_stack.hpp"
#include "cascache/assorted/assorted_func.hpp"
#include "cascache/cache/blob_pool.hpp"
#include "cascache/cache/content_table.hpp"
#include "cascache/cache/hash128.hpp"
#include "cascache/cache/key_table.hpp"
#include "cascache/cache/segment_layout.hpp"
#include "cascache/memory/shared_memory.hpp"
#include "cascache/util/dump_segment.hpp"

namespace cascache {
namespace util {

const uint32_t kMaxInconsistencies = 1000;

int DumpSegment::dump_to_stdout() {
  // runtime arguments
  std::cout << "<DumpSegment>" << std::endl
    << "<Args>" << std::endl
      << "  <verbose_>" << verbose_ << "</verbose_>" << std::endl
      << "  <limit_>" << limit_ << "</limit_>" << std::endl
      << "  <dump_keys_>" << dump_keys_ << "</dump_keys_>" << std::endl
      << "  <dump_contents_>" << dump_contents_ << "</dump_contents_>" << std::endl
      << "  <meta_path_>" << meta_path_ << "</meta_path_>" << std::endl
    << "</Args>" << std::endl;

  memory::SharedMemory memory;
  ErrorStack attach_error = memory.attach(meta_path_);
  if (attach_error.is_error()) {
    std::cerr << "Failed to attach the segment: " << attach_error << std::endl;
    std::cout << "</DumpSegment>" << std::endl;
    return 1;
  }
  // we are never the owner, so this only detaches.
  std::cout << memory << std::endl;

  cache::SegmentView segment(memory.get_block(), memory.get_size());
  ErrorCode header_error = segment.validate();
  std::cout << segment << std::endl;
  if (header_error != kErrorCodeOk) {
    add_inconsistency(SegmentInconsistency(SegmentInconsistency::kInvalidHeader, 0, header_error));
  } else {
    if (dump_keys_) {
      dump_key_table(&segment);
    }
    if (dump_contents_) {
      dump_content_table(&segment);
    }
  }

  // also write out execution summary at the end
  std::cout << "<Results>" << std::endl
    << "  <dumped_slots_>" << result_dumped_slots_ << "</dumped_slots_>" << std::endl
    << "  <limit_reached_>" << result_limit_reached_ << "</limit_reached_>" << std::endl
    << "  <inconsistencies_>" << std::endl;
  for (const SegmentInconsistency &inconsistency : result_inconsistencies_) {
    std::cout << "    " << inconsistency << std::endl;
  }
  std::cout << "  </inconsistencies_>" << std::endl
    << "</Results>" << std::endl;

  std::cout << "</DumpSegment>" << std::endl;
  memory.release_block();
  return result_inconsistencies_.empty() ? 0 : 2;
}

void DumpSegment::dump_key_table(cache::SegmentView* segment) {
  cache::BlobPool pool(segment);
  cache::KeyTable key_table(segment, &pool);
  cache::ContentTable content_table(segment);
  uint64_t occupied = 0;
  std::cout << "<KeyTable capacity=\"" << key_table.get_capacity() << "\">" << std::endl;
  for (cache::SlotIndex slot = 0; slot < key_table.get_capacity(); ++slot) {
    cache::KeySlotState state = key_table.get_state(slot);
    if (state == cache::kKeySlotEmpty) {
      continue;
    } else if (state == cache::kKeySlotTombstone) {
      if (verbose_ == kDetail && consume_limit()) {
        std::cout << "  <Tombstone slot=\"" << slot << "\" />" << std::endl;
      }
      continue;
    }

    ++occupied;
    cache::BlobAddress key_address = key_table.get_key_address(slot);
    std::string key;
    ErrorCode key_error = pool.read(key_address, cache::kBlobTagKey, &key);
    if (key_error != kErrorCodeOk) {
      add_inconsistency(SegmentInconsistency(
        SegmentInconsistency::kBrokenKeyBlob, slot, key_error));
    }
    cache::SlotIndex content_slot;
    bool has_content = content_table.find(key_table.get_fingerprint(slot), &content_slot);
    if (!has_content) {
      add_inconsistency(SegmentInconsistency(SegmentInconsistency::kDanglingFingerprint, slot));
    }
    if (!consume_limit()) {
      continue;
    }
    std::cout << "  <Key slot=\"" << slot << "\""
      << " address=\"" << assorted::Hex(key_address) << "\""
      << " timestamp=\"" << key_table.get_timestamp(slot) << "\"";
    if (verbose_ > kBrief) {
      std::cout << " hash=\"" << key_table.get_hash(slot) << "\""
        << " fingerprint=\"" << key_table.get_fingerprint(slot) << "\"";
    }
    std::cout << ">";
    if (key_error == kErrorCodeOk) {
      std::cout << assorted::HexString(key, verbose_ == kDetail ? 1024U : 32U);
    }
    std::cout << "</Key>" << std::endl;
  }
  std::cout << "</KeyTable>" << std::endl;

  if (occupied != key_table.get_item_count()) {
    add_inconsistency(SegmentInconsistency(SegmentInconsistency::kItemCountMismatch, 0));
  }
}

void DumpSegment::dump_content_table(cache::SegmentView* segment) {
  cache::BlobPool pool(segment);
  cache::ContentTable content_table(segment);
  std::cout << "<ContentTable capacity=\"" << content_table.get_capacity() << "\">" << std::endl;
  for (cache::SlotIndex slot = 0; slot < content_table.get_capacity(); ++slot) {
    if (!content_table.is_occupied(slot)) {
      continue;
    }
    cache::BlobAddress address = content_table.get_address(slot);
    cache::BlobRecord record;
    ErrorCode error = pool.inspect(address, &record);
    if (error == kErrorCodeOk && record.tag_ != cache::kBlobTagContent) {
      error = kErrorCodeCacheCorruptBlob;
    }
    if (error != kErrorCodeOk) {
      add_inconsistency(SegmentInconsistency(
        SegmentInconsistency::kBrokenContentBlob, slot, error));
    }
    if (!consume_limit()) {
      continue;
    }
    std::cout << "  <Content slot=\"" << slot << "\""
      << " fingerprint=\"" << content_table.get_fingerprint(slot) << "\""
      << " address=\"" << assorted::Hex(address) << "\"";
    if (error == kErrorCodeOk) {
      std::cout << " length=\"" << record.length_ << "\"";
    }
    std::cout << ">";
    if (error == kErrorCodeOk && verbose_ > kBrief) {
      std::string content;
      if (pool.read(address, cache::kBlobTagContent, &content) == kErrorCodeOk) {
        std::cout << assorted::HexString(content, verbose_ == kDetail ? 1024U : 32U);
      }
    }
    std::cout << "</Content>" << std::endl;
  }
  std::cout << "</ContentTable>" << std::endl;
}

bool DumpSegment::consume_limit() {
  if (limit_ >= 0 && result_dumped_slots_ >= static_cast<uint64_t>(limit_)) {
    result_limit_reached_ = true;
    return false;
  }
  ++result_dumped_slots_;
  return true;
}

void DumpSegment::add_inconsistency(const SegmentInconsistency& inconsistency) {
  if (result_inconsistencies_.size() == kMaxInconsistencies) {
    result_inconsistencies_.emplace_back(
      SegmentInconsistency(SegmentInconsistency::kTooManyInconsistencies, inconsistency.slot_));
  } else if (result_inconsistencies_.size() < kMaxInconsistencies) {
    result_inconsistencies_.emplace_back(inconsistency);
  }
}

std::ostream& operator<<(std::ostream& o, const SegmentInconsistency& v) {
  o << "<SegmentInconsistency>"
    << "<type>" << SegmentInconsistency::type_to_string(v.type_) << "</type>"
    << "<type_description>" << SegmentInconsistency::type_to_description(v.type_)
      << "</type_description>"
    << "<slot>" << v.slot_ << "</slot>";
  if (v.error_ != kErrorCodeOk) {
    o << "<error>" << get_error_name(v.error_) << "</error>";
  }
  o << "</SegmentInconsistency>";
  return o;
}

}  // namespace util
}  // namespace cascache
