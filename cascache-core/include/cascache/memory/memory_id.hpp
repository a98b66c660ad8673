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
#ifndef CASCACHE_MEMORY_MEMORY_ID_HPP_
#define CASCACHE_MEMORY_MEMORY_ID_HPP_

#include <numa.h>

namespace cascache {
namespace memory {

/**
 * @brief Automatically sets and resets ::numa_set_preferred().
 * @ingroup MEMORY
 * @details
 * This is the only way to choose the NUMA node of a System-V shared memory block,
 * as mbind does nothing for it. A negative numa_node means no preference, which is the default
 * because the processes sharing a cache usually run on all nodes.
 */
struct ScopedNumaPreferred {
  explicit ScopedNumaPreferred(int numa_node, bool retain_old = false)
    : old_value_(-1), numa_enabled_(false) {
    // if the machine is not a NUMA machine, then avoid calling libnuma functions.
    if (numa_node < 0 || ::numa_available() < 0) {
      return;
    }
    numa_enabled_ = true;
    if (retain_old) {
      old_value_ = ::numa_preferred();
    }
    // in order to run even on a machine with fewer sockets, we just take rem.
    int nodes = ::numa_num_configured_nodes();
    ::numa_set_preferred(nodes > 0 ? numa_node % nodes : 0);
  }
  ~ScopedNumaPreferred() {
    if (numa_enabled_) {
      ::numa_set_preferred(old_value_);
    }
  }
  int old_value_;
  bool numa_enabled_;
};

}  // namespace memory
}  // namespace cascache

#endif  // CASCACHE_MEMORY_MEMORY_ID_HPP_
