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
#include "cascache/cache/cache_stat.hpp"

#include <ostream>

namespace cascache {
namespace cache {

CacheStat::CacheStat()
  : item_count_(0),
    max_items_(0),
    key_table_capacity_(0),
    content_table_capacity_(0),
    occupied_key_slots_(0),
    tombstone_key_slots_(0),
    content_entries_(0),
    pool_size_(0),
    pool_used_(0),
    hits_(0),
    misses_(0),
    segment_version_(0) {
}

std::ostream& operator<<(std::ostream& o, const CacheStat& v) {
  o << "<CacheStat>"
    << "<item_count_>" << v.item_count_ << "</item_count_>"
    << "<max_items_>" << v.max_items_ << "</max_items_>"
    << "<key_table_capacity_>" << v.key_table_capacity_ << "</key_table_capacity_>"
    << "<content_table_capacity_>" << v.content_table_capacity_ << "</content_table_capacity_>"
    << "<occupied_key_slots_>" << v.occupied_key_slots_ << "</occupied_key_slots_>"
    << "<tombstone_key_slots_>" << v.tombstone_key_slots_ << "</tombstone_key_slots_>"
    << "<content_entries_>" << v.content_entries_ << "</content_entries_>"
    << "<pool_size_>" << v.pool_size_ << "</pool_size_>"
    << "<pool_used_>" << v.pool_used_ << "</pool_used_>"
    << "<hits_>" << v.hits_ << "</hits_>"
    << "<misses_>" << v.misses_ << "</misses_>"
    << "<segment_version_>" << v.segment_version_ << "</segment_version_>"
    << "</CacheStat>";
  return o;
}

}  // namespace cache
}  // namespace cascache
