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
#include "cascache/cache/hash128.hpp"

#include <xxhash.h>

#include <ostream>

#include "cascache/assorted/assorted_func.hpp"

namespace cascache {
namespace cache {

Hash128 default_hash_function(const void* data, uint64_t length) {
  uint64_t high = ::XXH64(data, length, kXxhashHighSeed);
  uint64_t low = ::XXH64(data, length, kXxhashLowSeed);
  return Hash128::from_halves(high, low);
}

std::ostream& operator<<(std::ostream& o, const Hash128& v) {
  o << assorted::Hex(v.high(), 16) << ":" << assorted::Hex(v.low(), 16);
  return o;
}

}  // namespace cache
}  // namespace cascache
