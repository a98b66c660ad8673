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
#include "cascache/soc/shared_mutex.hpp"

#include <errno.h>
#include <time.h>
#include <glog/logging.h>

#include "cascache/assert_nd.hpp"

namespace cascache {
namespace soc {

ErrorCode SharedMutex::initialize(bool recursive) {
  uninitialize();
  int attr_ret = ::pthread_mutexattr_init(&attr_);
  if (attr_ret != 0) {
    return kErrorCodeSocMutexInitFailed;
  }

  int shared_ret = ::pthread_mutexattr_setpshared(&attr_, PTHREAD_PROCESS_SHARED);
  int type_ret = ::pthread_mutexattr_settype(
    &attr_,
    recursive ? PTHREAD_MUTEX_RECURSIVE_NP : PTHREAD_MUTEX_FAST_NP);
  int robust_ret = ::pthread_mutexattr_setrobust(&attr_, PTHREAD_MUTEX_ROBUST);
  if (shared_ret != 0 || type_ret != 0 || robust_ret != 0) {
    ::pthread_mutexattr_destroy(&attr_);
    return kErrorCodeSocMutexInitFailed;
  }

  int mutex_ret = ::pthread_mutex_init(&mutex_, &attr_);
  if (mutex_ret != 0) {
    ::pthread_mutexattr_destroy(&attr_);
    return kErrorCodeSocMutexInitFailed;
  }

  recursive_ = recursive;
  initialized_ = true;
  return kErrorCodeOk;
}

void SharedMutex::uninitialize() {
  if (!initialized_) {
    return;
  }

  int mutex_ret = ::pthread_mutex_destroy(&mutex_);
  ASSERT_ND(mutex_ret == 0);

  int attr_ret = ::pthread_mutexattr_destroy(&attr_);
  ASSERT_ND(attr_ret == 0);
  UNUSED_ND(mutex_ret);
  UNUSED_ND(attr_ret);

  initialized_ = false;
}

bool SharedMutex::on_lock_result(int ret) {
  if (ret == EOWNERDEAD) {
    LOG(WARNING) << "The previous holder of a shared mutex died while holding it."
      << " Taking it over.";
    int consistent_ret = ::pthread_mutex_consistent(&mutex_);
    ASSERT_ND(consistent_ret == 0);
    UNUSED_ND(consistent_ret);
    return true;
  }
  return ret == 0;
}

void SharedMutex::lock() {
  ASSERT_ND(initialized_);
  int ret = ::pthread_mutex_lock(&mutex_);
  bool acquired = on_lock_result(ret);
  ASSERT_ND(acquired);
  UNUSED_ND(acquired);
}

bool SharedMutex::timedlock(uint64_t timeout_nanosec) {
  if (timeout_nanosec == 0) {
    return trylock();
  }

  ASSERT_ND(initialized_);
  struct timespec timeout;
  ::clock_gettime(CLOCK_REALTIME, &timeout);
  timeout.tv_sec += timeout_nanosec / 1000000000ULL;
  timeout.tv_nsec += timeout_nanosec % 1000000000ULL;
  timeout.tv_sec += timeout.tv_nsec / 1000000000L;
  timeout.tv_nsec %= 1000000000L;
  int ret = ::pthread_mutex_timedlock(&mutex_, &timeout);
  ASSERT_ND(ret == 0 || ret == ETIMEDOUT || ret == EOWNERDEAD);
  return on_lock_result(ret);
}

bool SharedMutex::trylock() {
  ASSERT_ND(initialized_);
  int ret = ::pthread_mutex_trylock(&mutex_);
  return on_lock_result(ret);
}

void SharedMutex::unlock() {
  ASSERT_ND(initialized_);
  int ret = ::pthread_mutex_unlock(&mutex_);
  ASSERT_ND(ret == 0);
  UNUSED_ND(ret);
}

void SharedMutexScope::lock() {
  if (locked_by_me_) {
    return;
  }

  mutex_->lock();
  locked_by_me_ = true;
}

bool SharedMutexScope::timedlock(uint64_t timeout_nanosec) {
  if (locked_by_me_) {
    return true;
  }

  locked_by_me_ = mutex_->timedlock(timeout_nanosec);
  return locked_by_me_;
}

void SharedMutexScope::unlock() {
  if (!locked_by_me_) {
    return;
  }

  mutex_->unlock();
  locked_by_me_ = false;
}

}  // namespace soc
}  // namespace cascache
