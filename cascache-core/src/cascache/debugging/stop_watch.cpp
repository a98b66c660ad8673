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
#include "cascache/debugging/stop_watch.hpp"

#include <time.h>

namespace cascache {
namespace debugging {

namespace {
uint64_t read_clock(clockid_t clock) {
  struct timespec now;
  // only fails for an invalid clock id
  ::clock_gettime(clock, &now);
  return static_cast<uint64_t>(now.tv_sec) * 1000000000ULL + static_cast<uint64_t>(now.tv_nsec);
}
}  // namespace

uint64_t get_now_nanosec() {
  return read_clock(CLOCK_REALTIME);
}

uint64_t get_monotonic_nanosec() {
  return read_clock(CLOCK_MONOTONIC);
}

}  // namespace debugging
}  // namespace cascache
