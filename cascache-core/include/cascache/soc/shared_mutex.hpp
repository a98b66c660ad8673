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
#ifndef CASCACHE_SOC_SHARED_MUTEX_HPP_
#define CASCACHE_SOC_SHARED_MUTEX_HPP_

#include <pthread.h>
#include <stdint.h>

#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"

namespace cascache {
namespace soc {

/**
 * @brief A mutex that can be placed in shared memory and used from multiple processes.
 * @ingroup SOC
 * @details
 * C++11's mutex doesn't work for multi-process.
 * We need to directly manipulate pthread_mutexattr_setpshared, hence this class.
 * This object is also shared-memory friendly, meaning it has no heap-allocated member.
 * It can be reset to a usable state via memset(zero) followed by initialize(), too.
 *
 * The mutex is \e robust. When a process dies while holding it, the next locker takes it
 * over rather than blocking forever. The cache state guarded by the mutex might be
 * half-modified in that case, which ContentCache::verify() can detect.
 *
 * The cache requires a recursive mutex so that one process can nest cache operations
 * under its own outer critical section.
 *
 * Example usage:
 * @code{.cpp}
 * SharedMutex* mtx = reinterpret_cast<SharedMutex*>(shared_block);
 * CHECK_ERROR_CODE(mtx->initialize(true));  // only in the process that created the block
 * {
 *   SharedMutexScope scope(mtx, false);
 *   if (!scope.timedlock(1000000000ULL)) {
 *     return kErrorCodeTimeout;
 *   }
 *   do_something();
 * }  // automatically unlocked here
 * @endcode
 */
class SharedMutex CXX11_FINAL {
 public:
  SharedMutex() : initialized_(false), recursive_(false) {}
  ~SharedMutex() { uninitialize(); }

  // Disable copy constructors
  SharedMutex(const SharedMutex&) CXX11_FUNC_DELETE;
  SharedMutex& operator=(const SharedMutex&) CXX11_FUNC_DELETE;

  /**
   * Makes this mutex ready. Only one process should call this, before others use it.
   * @param[in] recursive whether the owning thread can re-lock the mutex
   * @return kErrorCodeSocMutexInitFailed if pthread rejected the attributes
   */
  ErrorCode initialize(bool recursive = false);
  void uninitialize();
  bool is_initialized() const { return initialized_; }
  bool is_recursive() const   { return recursive_; }

  /** Unconditionally lock */
  void lock();

  /**
   * Try lock up to the given timeout
   * @param[in] timeout_nanosec timeout in nanoseconds
   * @return whether this thread acquired the lock
   */
  bool timedlock(uint64_t timeout_nanosec);

  /**
   * Instantaneously try the lock.
   * @return whether this thread acquired the lock
   */
  bool trylock();

  /** Unlock it */
  void unlock();

  pthread_mutex_t*  get_raw_mutex() { return &mutex_; }

 private:
  /** Whether this mutex is ready for use. We don't tolerate race in initialization. */
  bool                initialized_;
  /** Whether this mutex is a recursive (re-lockable) mutex */
  bool                recursive_;

  pthread_mutex_t     mutex_;
  pthread_mutexattr_t attr_;

  /** Handles the return value of pthread lock functions. EOWNERDEAD is taken as acquired. */
  bool                on_lock_result(int ret);
};

/**
 * @brief Auto-lock scope object for SharedMutex.
 * @ingroup SOC
 * @details
 * SharedMutex itself has auto-release feature, but only when it is on stack.
 * In many cases SharedMutex is placed in shared memory, so its destructor is never called.
 * Instead, this object provides the auto-release semantics.
 */
class SharedMutexScope CXX11_FINAL {
 public:
  SharedMutexScope(SharedMutex* mutex, bool lock_initially = true)
    : mutex_(mutex), locked_by_me_(false) {
    if (lock_initially) {
      lock();
    }
  }
  ~SharedMutexScope() { unlock(); }

  // Disable copy constructors
  SharedMutexScope(const SharedMutexScope&) CXX11_FUNC_DELETE;
  SharedMutexScope& operator=(const SharedMutexScope&) CXX11_FUNC_DELETE;

  bool is_locked_by_me() const { return locked_by_me_; }
  SharedMutex* get_mutex() const { return mutex_; }

  void lock();
  /** @return whether this scope now holds the lock */
  bool timedlock(uint64_t timeout_nanosec);
  void unlock();

 private:
  SharedMutex* const  mutex_;
  bool                locked_by_me_;
};

}  // namespace soc
}  // namespace cascache

#endif  // CASCACHE_SOC_SHARED_MUTEX_HPP_
