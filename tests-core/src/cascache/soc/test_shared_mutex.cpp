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
#include <unistd.h>
#include <gtest/gtest.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <new>
#include <string>

#include "cascache/test_common.hpp"
#include "cascache/assorted/atomic_fences.hpp"
#include "cascache/debugging/stop_watch.hpp"
#include "cascache/memory/shared_memory.hpp"
#include "cascache/soc/shared_mutex.hpp"

namespace cascache {
namespace soc {

DEFINE_TEST_CASE_PACKAGE(SharedMutexTest, cascache.soc);

TEST(SharedMutexTest, Alone) {
  SharedMutex mtx;
  EXPECT_FALSE(mtx.is_initialized());
  EXPECT_EQ(kErrorCodeOk, mtx.initialize());
  EXPECT_TRUE(mtx.is_initialized());
  EXPECT_FALSE(mtx.is_recursive());
  mtx.lock();
  mtx.unlock();
  mtx.lock();
  mtx.unlock();
  EXPECT_TRUE(mtx.trylock());
  mtx.unlock();
  mtx.uninitialize();
  EXPECT_FALSE(mtx.is_initialized());
}

TEST(SharedMutexTest, Recursive) {
  SharedMutex mtx;
  EXPECT_EQ(kErrorCodeOk, mtx.initialize(true));
  EXPECT_TRUE(mtx.is_recursive());
  {
    SharedMutexScope outer(&mtx);
    EXPECT_TRUE(outer.is_locked_by_me());
    SharedMutexScope inner(&mtx, false);
    EXPECT_TRUE(inner.timedlock(1000000ULL));
    EXPECT_TRUE(inner.is_locked_by_me());
  }
  // both scopes released their holds
  EXPECT_TRUE(mtx.trylock());
  mtx.unlock();
  mtx.uninitialize();
}

TEST(SharedMutexTest, ScopeUnlockTwice) {
  SharedMutex mtx;
  EXPECT_EQ(kErrorCodeOk, mtx.initialize());
  SharedMutexScope scope(&mtx);
  scope.unlock();
  EXPECT_FALSE(scope.is_locked_by_me());
  scope.unlock();  // no-op
  EXPECT_TRUE(mtx.trylock());
  mtx.unlock();
}

TEST(SharedMutexTest, SharedMemoryAlone) {
  memory::SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("SharedMemoryAlone");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 21, -1));
  memory.mark_for_release();
  EXPECT_NE(nullptr, memory.get_block());
  SharedMutex *mtx = new (memory.get_block()) SharedMutex();
  EXPECT_EQ(kErrorCodeOk, mtx->initialize());
  mtx->lock();
  mtx->unlock();
  {
    SharedMutexScope scope(mtx);
  }
  mtx->uninitialize();
}

TEST(SharedMutexTest, TimedlockFork) {
  memory::SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("TimedlockFork");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 21, -1));
  char* block = memory.get_block();
  SharedMutex *mtx = new (block) SharedMutex();
  EXPECT_EQ(kErrorCodeOk, mtx->initialize(true));
  mtx->lock();
  assorted::memory_fence_release();

  pid_t pid = ::fork();
  if (pid == -1) {
    memory.mark_for_release();
    EXPECT_TRUE(false);
  } else if (pid == 0) {
    // child. the parent holds the lock.
    debugging::StopWatch watch;
    bool acquired = mtx->timedlock(200000000ULL);
    watch.stop();
    int code = 0;
    if (acquired) {
      code = 1;
    } else if (watch.elapsed_ms() < 150U) {
      code = 2;
    } else if (mtx->timedlock(0)) {
      code = 3;
    }
    ::_exit(code);
  } else {
    int status;
    pid_t result = ::waitpid(pid, &status, 0);
    EXPECT_EQ(pid, result);
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(0, WEXITSTATUS(status));
  }
  mtx->unlock();
  mtx->uninitialize();
  memory.release_block();
}

TEST(SharedMutexTest, HolderDied) {
  memory::SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("HolderDied");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 21, -1));
  SharedMutex *mtx = new (memory.get_block()) SharedMutex();
  EXPECT_EQ(kErrorCodeOk, mtx->initialize(true));
  assorted::memory_fence_release();

  pid_t pid = ::fork();
  if (pid == -1) {
    memory.mark_for_release();
    EXPECT_TRUE(false);
  } else if (pid == 0) {
    // child dies while holding the lock
    mtx->lock();
    ::_exit(0);
  } else {
    int status;
    pid_t result = ::waitpid(pid, &status, 0);
    EXPECT_EQ(pid, result);
    EXPECT_EQ(0, status);
    EXPECT_TRUE(mtx->timedlock(1000000000ULL));
    mtx->unlock();
    EXPECT_TRUE(mtx->trylock());
    mtx->unlock();
  }
  mtx->uninitialize();
  memory.release_block();
}

// This must be the last test. otherwise gtest executes the following tests twice.
TEST(SharedMutexTest, SharedMemoryFork) {
  memory::SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("SharedMemoryFork");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 21, -1));
  EXPECT_NE(nullptr, memory.get_block());
  char* block = memory.get_block();

  SharedMutex *mtx = new (block) SharedMutex();
  int *total = reinterpret_cast<int*>(block + sizeof(SharedMutex));
  EXPECT_EQ(kErrorCodeOk, mtx->initialize());
  *total = 0;
  assorted::memory_fence_release();

  pid_t pid = ::fork();
  const uint32_t kIterations = 3000;
  if (pid == -1) {
    memory.mark_for_release();
    EXPECT_TRUE(false);
  } else if (pid == 0) {
    // child
    memory::SharedMemory memory_child;
    COERCE_ERROR(memory_child.attach(meta_path));
    char* child_block = memory_child.get_block();
    SharedMutex *child_mtx = reinterpret_cast<SharedMutex*>(child_block);
    int *child_total = reinterpret_cast<int*>(child_block + sizeof(SharedMutex));
    EXPECT_TRUE(child_mtx->is_initialized());
    for (uint32_t i = 0; i < kIterations; ++i) {
      SharedMutexScope scope(child_mtx);
      *child_total = (*child_total) + 1;
    }
    memory_child.release_block();
    ::_exit(0);
  } else {
    // parent
    EXPECT_TRUE(mtx->is_initialized());
    for (uint32_t i = 0; i < kIterations; ++i) {
      SharedMutexScope scope(mtx);
      *total = (*total) + 1;
    }

    int status;
    pid_t result = ::waitpid(pid, &status, 0);
    EXPECT_EQ(pid, result);
    EXPECT_EQ(0, status);
  }
  assorted::memory_fence_acquire();
  EXPECT_EQ(kIterations * 2, static_cast<uint32_t>(*total));
  mtx->uninitialize();
  memory.release_block();
}

}  // namespace soc
}  // namespace cascache

TEST_MAIN_CAPTURE_SIGNALS(SharedMutexTest, cascache.soc);
