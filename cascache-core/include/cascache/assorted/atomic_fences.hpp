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
#ifndef CASCACHE_ASSORTED_ATOMIC_FENCES_HPP_
#define CASCACHE_ASSORTED_ATOMIC_FENCES_HPP_

/**
 * @file cascache/assorted/atomic_fences.hpp
 * @ingroup ASSORTED
 * @brief Atomic fence methods that work for both C++11/non-C++11 code.
 * @details
 * Most of the segment is read and written only under the cache lock, whose acquire/release
 * already orders the memory accesses. The exception is the magic word, which a creating process
 * publishes without the lock and attaching processes poll.
 * We use gcc/clang's builtin (__atomic_thread_fence) to avoid C++11 code in public headers.
 */
namespace cascache {
namespace assorted {

/**
 * @brief Equivalent to std::atomic_thread_fence(std::memory_order_acquire).
 * @ingroup ASSORTED
 * @details
 * Prior writes made to other memory locations by the thread that did the release become
 * visible in this thread.
 */
inline void memory_fence_acquire() {
  ::__atomic_thread_fence(__ATOMIC_ACQUIRE);
}

/**
 * @brief Equivalent to std::atomic_thread_fence(std::memory_order_release).
 * @ingroup ASSORTED
 * @details
 * Prior writes to other memory locations become visible to the threads that do an acquire
 * after observing a later write.
 */
inline void memory_fence_release() {
  ::__atomic_thread_fence(__ATOMIC_RELEASE);
}

}  // namespace assorted
}  // namespace cascache

#endif  // CASCACHE_ASSORTED_ATOMIC_FENCES_HPP_
