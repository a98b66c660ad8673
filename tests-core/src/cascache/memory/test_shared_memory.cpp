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
#include <spawn.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <iostream>
#include <string>
#include <utility>

#include "cascache/test_common.hpp"
#include "cascache/assorted/assorted_func.hpp"
#include "cascache/assorted/atomic_fences.hpp"
#include "cascache/fs/filesystem.hpp"
#include "cascache/fs/path.hpp"
#include "cascache/memory/shared_memory.hpp"

/**
 * @file test_shared_memory.cpp
 * Testcases for SharedMemory and OwnershipToken.
 * If possible, use --trace-children=yes to check memory leak in child processes.
 */
namespace cascache {
namespace memory {

DEFINE_TEST_CASE_PACKAGE(SharedMemoryTest, cascache.memory);

TEST(SharedMemoryTest, Alone) {
  SharedMemory memory;
  EXPECT_TRUE(memory.get_block() == nullptr);
  EXPECT_TRUE(memory.is_null());
  EXPECT_FALSE(memory.is_owned());
  std::string meta_path = get_random_tmp_file_path("alone");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 21, -1));
  EXPECT_TRUE(memory.get_block() != nullptr);
  EXPECT_EQ(1ULL << 21, memory.get_size());
  EXPECT_EQ(meta_path, memory.get_meta_path());
  EXPECT_NE(0, memory.get_shmid());
  EXPECT_NE(0, memory.get_shmkey());
  EXPECT_FALSE(memory.is_null());
  EXPECT_TRUE(memory.is_owned());
  EXPECT_EQ(::getpid(), memory.get_owner_token().get_owner_pid());
  EXPECT_EQ(0, memory.get_block()[12345]);  // zero-filled
  EXPECT_TRUE(fs::exists(fs::Path(meta_path)));
  memory.release_block();
  EXPECT_TRUE(memory.get_block() == nullptr);
  EXPECT_TRUE(memory.is_null());
  EXPECT_FALSE(memory.is_owned());
  EXPECT_FALSE(fs::exists(fs::Path(meta_path)));  // the owner removes the meta file
}

TEST(SharedMemoryTest, ZeroSize) {
  SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("zero");
  ErrorStack error = memory.alloc(meta_path, 0, -1);
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(kErrorCodeInvalidParameter, error.get_error_code());
  EXPECT_TRUE(memory.is_null());
  EXPECT_FALSE(fs::exists(fs::Path(meta_path)));
}

TEST(SharedMemoryTest, MetaExists) {
  SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("exists");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 16, -1));
  memory.get_block()[3] = 42;

  SharedMemory another;
  ErrorStack error = another.alloc(meta_path, 1ULL << 16, -1);
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(kErrorCodeSocShmAllocFailed, error.get_error_code());
  EXPECT_TRUE(another.is_null());
  EXPECT_FALSE(another.is_owned());

  // the failed alloc must not have touched the existing one
  EXPECT_TRUE(fs::exists(fs::Path(meta_path)));
  SharedMemory attached;
  COERCE_ERROR(attached.attach(meta_path));
  EXPECT_EQ(42, attached.get_block()[3]);
  attached.release_block();
  memory.release_block();
}

TEST(SharedMemoryTest, AttachMissing) {
  SharedMemory memory;
  ErrorStack error = memory.attach(get_random_tmp_file_path("missing"));
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(kErrorCodeSocShmAttachFailed, error.get_error_code());
  EXPECT_TRUE(memory.is_null());
}

TEST(SharedMemoryTest, AttachIsNotOwner) {
  SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("attach_owner");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 16, -1));
  {
    SharedMemory attached;
    COERCE_ERROR(attached.attach(meta_path));
    EXPECT_FALSE(attached.is_owned());
    EXPECT_EQ(memory.get_shmid(), attached.get_shmid());
    attached.get_block()[7] = 11;
    attached.mark_for_release();  // no effect by non-owners
    attached.release_block();
  }
  EXPECT_TRUE(fs::exists(fs::Path(meta_path)));
  EXPECT_EQ(11, memory.get_block()[7]);

  // still attachable, so the non-owner did not destroy it
  SharedMemory again;
  COERCE_ERROR(again.attach(meta_path));
  EXPECT_EQ(11, again.get_block()[7]);
  again.release_block();
  memory.release_block();
}

TEST(SharedMemoryTest, MoveOwnership) {
  SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("move");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 16, -1));
  char* block = memory.get_block();

  SharedMemory moved(std::move(memory));
  EXPECT_TRUE(memory.is_null());
  EXPECT_FALSE(memory.is_owned());
  EXPECT_TRUE(moved.is_owned());
  EXPECT_EQ(block, moved.get_block());

  memory.release_block();  // no-op
  EXPECT_TRUE(fs::exists(fs::Path(meta_path)));

  SharedMemory assigned;
  assigned = std::move(moved);
  EXPECT_TRUE(assigned.is_owned());
  EXPECT_FALSE(moved.is_owned());
  assigned.release_block();
  EXPECT_FALSE(fs::exists(fs::Path(meta_path)));
}

TEST(SharedMemoryTest, ShareFork) {
  bool was_child = false;
  {
    SharedMemory memory;
    EXPECT_TRUE(memory.get_block() == nullptr);
    EXPECT_TRUE(memory.is_null());
    std::string meta_path = get_random_tmp_file_path("share_fork");
    COERCE_ERROR(memory.alloc(meta_path, 1ULL << 21, -1));
    memory.get_block()[3] = 42;
    pid_t pid = ::fork();
    if (pid == -1) {
      memory.mark_for_release();
      EXPECT_TRUE(false);
    } else if (pid == 0) {
      // child. it inherits the bytes of the handle, but not the ownership.
      EXPECT_FALSE(memory.is_owned());
      SharedMemory memory_child;
      COERCE_ERROR(memory_child.attach(meta_path));
      EXPECT_FALSE(memory_child.is_null());
      EXPECT_EQ(1ULL << 21, memory_child.get_size());
      EXPECT_EQ(meta_path, memory_child.get_meta_path());
      EXPECT_NE(0, memory_child.get_shmid());
      EXPECT_NE(0, memory_child.get_shmkey());
      EXPECT_EQ(42, memory_child.get_block()[3]);
      EXPECT_FALSE(memory_child.is_owned());
      memory_child.get_block()[4] = 43;
      was_child = true;
    } else {
      // parent
      int status;
      pid_t result = ::waitpid(pid, &status, 0);
      EXPECT_EQ(pid, result);
      EXPECT_EQ(0, status);
      assorted::memory_fence_acquire();
      EXPECT_EQ(43, memory.get_block()[4]);
      // the child released its copy of the handle, which must not have destroyed anything
      EXPECT_TRUE(fs::exists(fs::Path(meta_path)));
    }

    memory.release_block();
  }
  if (was_child) {
    ::_exit(0);  // otherwise, it goes on to execute the following tests again.
  }
}

TEST(SharedMemoryTest, ShareSpawn) {
  const char* env_meta_path = ::getenv("test_meta_path");
  if (env_meta_path) {
    // child process!
    {
      std::string meta_path(env_meta_path);
      std::cout << "I'm a child process(" << ::getpid()
        << "). meta_path=" << meta_path << std::endl;
      SharedMemory memory;
      COERCE_ERROR(memory.attach(meta_path));
      EXPECT_FALSE(memory.is_null());
      EXPECT_EQ(1ULL << 21, memory.get_size());
      EXPECT_EQ(meta_path, memory.get_meta_path());
      EXPECT_EQ(42, memory.get_block()[3]);
      EXPECT_FALSE(memory.is_owned());
      memory.get_block()[5] = 67;
    }
    ::_exit(0);  // for the same reason, this should terminate now.
    return;
  } else {
    std::cout << "I'm a master process(" << ::getpid() << ")" << std::endl;
  }

  SharedMemory memory;
  std::string meta_path = get_random_tmp_file_path("share_spawn");
  COERCE_ERROR(memory.alloc(meta_path, 1ULL << 21, -1));
  memory.get_block()[3] = 42;

  posix_spawn_file_actions_t file_actions;
  posix_spawnattr_t attr;
  ::posix_spawn_file_actions_init(&file_actions);
  ::posix_spawnattr_init(&attr);

  std::string path = assorted::get_current_executable_path();
  // execute this test
  char* const new_argv[] = {
    const_cast<char*>(path.c_str()),
    const_cast<char*>("--gtest_filter=SharedMemoryTest.ShareSpawn"),
    nullptr};

  // with meta_path in environment variable
  std::string meta("test_meta_path=");
  meta += meta_path;
  char* const new_envp[] = {
    const_cast<char*>(meta.c_str()),
    nullptr};

  pid_t child_pid;
  std::cout << "spawning: " << path << std::endl;
  int ret = ::posix_spawn(&child_pid, path.c_str(), &file_actions, &attr, new_argv, new_envp);

  EXPECT_EQ(0, ret);
  if (ret == 0) {
    EXPECT_NE(0, child_pid);
    int status = 0;
    pid_t result = ::waitpid(child_pid, &status, 0);
    std::cout << "child process(" << child_pid << ") died. result=" << result << std::endl;
    EXPECT_EQ(child_pid, result);
    EXPECT_EQ(0, status);
  }
  ::posix_spawn_file_actions_destroy(&file_actions);
  ::posix_spawnattr_destroy(&attr);
  assorted::memory_fence_acquire();
  EXPECT_EQ(67, memory.get_block()[5]);
  memory.release_block();
}

}  // namespace memory
}  // namespace cascache

TEST_MAIN_CAPTURE_SIGNALS(SharedMemoryTest, cascache.memory);
