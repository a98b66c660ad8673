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
#ifndef CASCACHE_MEMORY_NAMESPACE_INFO_HPP_
#define CASCACHE_MEMORY_NAMESPACE_INFO_HPP_

/**
 * @namespace cascache::memory
 * @brief Shared memory blocks that outlive and are shared by processes.
 * @details
 * The cache lives in a System-V shared memory block (shmget/shmat).
 * We chose System-V over POSIX shm_open/mmap because shmctl(IPC_RMID) lets the creator mark
 * the block for release while others keep using it; the kernel reclaims it when the last
 * process detaches, including processes that crashed without detaching.
 *
 * A block is located by a \e meta file, a small file at a path every process agrees on,
 * containing the size, NUMA node and shmkey of the block.
 */

/**
 * @defgroup MEMORY Shared Memory
 * @copydoc cascache::memory
 */

#endif  // CASCACHE_MEMORY_NAMESPACE_INFO_HPP_
