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
#ifndef CASCACHE_MEMORY_SHARED_MEMORY_HPP_
#define CASCACHE_MEMORY_SHARED_MEMORY_HPP_

#include <stdint.h>
#include <sys/types.h>

#include <iosfwd>
#include <string>

#include "cascache/cxx11.hpp"
#include "cascache/error_stack.hpp"

namespace cascache {
namespace memory {

class SharedMemory;

/**
 * @brief Proof that this process created a shared memory block and must destroy it.
 * @ingroup MEMORY
 * @details
 * Only SharedMemory::alloc() can create a held token. It can't be copied, only moved,
 * so there is exactly one holder per block within the creating process.
 * A child process created by fork() inherits a bitwise copy of the token, but is_held()
 * compares the recorded pid with getpid(), so the child never acts as the owner.
 */
class OwnershipToken CXX11_FINAL {
 public:
  /** An empty token that holds nothing. */
  OwnershipToken() CXX11_NOEXCEPT : owner_pid_(0) {}

  OwnershipToken(const OwnershipToken &other) CXX11_FUNC_DELETE;
  OwnershipToken& operator=(const OwnershipToken &other) CXX11_FUNC_DELETE;

#ifndef DISABLE_CXX11_IN_PUBLIC_HEADERS
  OwnershipToken(OwnershipToken &&other) noexcept : owner_pid_(other.owner_pid_) {
    other.owner_pid_ = 0;
  }
  OwnershipToken& operator=(OwnershipToken &&other) noexcept {
    owner_pid_ = other.owner_pid_;
    other.owner_pid_ = 0;
    return *this;
  }
#endif  // DISABLE_CXX11_IN_PUBLIC_HEADERS

  /** Whether the calling process holds this token. */
  bool        is_held() const;
  /** The pid recorded at creation, or 0. Might be another (parent) process. */
  pid_t       get_owner_pid() const { return owner_pid_; }
  /** Gives up the ownership without destroying anything. */
  void        relinquish() { owner_pid_ = 0; }

 private:
  friend class SharedMemory;
  explicit OwnershipToken(pid_t owner_pid) : owner_pid_(owner_pid) {}

  pid_t       owner_pid_;
};

/**
 * @brief Represents memory shared between processes.
 * @ingroup MEMORY
 * @details
 * This class is like an AlignedMemory, but for a shmget/shmat block located by a meta file.
 * The process that called alloc() holds the OwnershipToken, and releasing the block from that
 * process marks it with IPC_RMID and deletes the meta file. Other processes, and forked children
 * of the owner, merely detach.
 *
 * @par Moveable/Copiable
 * This object is NOT copyable. It is moveable when C++11 is enabled.
 *
 * @par Zero-initialization
 * alloc() memsets the whole block to zero, so a freshly allocated segment has no stale
 * bytes from a previous user of the same physical pages.
 *
 * @par Hugepages
 * When use_hugepages is true, the size is rounded up to 2MB and SHM_HUGETLB is given,
 * unless running on valgrind which doesn't support it. This requires vm.nr_hugepages.
 */
class SharedMemory CXX11_FINAL {
 public:
  /** Empty constructor which allocates nothing. */
  SharedMemory() CXX11_NOEXCEPT
    : size_(0), numa_node_(-1), shmid_(0), shmkey_(0), block_(CXX11_NULLPTR) {}

  // Disable copy constructor
  SharedMemory(const SharedMemory &other) CXX11_FUNC_DELETE;
  SharedMemory& operator=(const SharedMemory &other) CXX11_FUNC_DELETE;

#ifndef DISABLE_CXX11_IN_PUBLIC_HEADERS
  /** Move constructor that steals the memory block and the ownership from other. */
  SharedMemory(SharedMemory &&other) noexcept;
  /** Move assignment. Releases the current block of this object first. */
  SharedMemory& operator=(SharedMemory &&other) noexcept;
#endif  // DISABLE_CXX11_IN_PUBLIC_HEADERS

  /** Automatically releases the memory. */
  ~SharedMemory() { release_block(); }

  /**
   * @brief Newly allocate a shared memory of given size on given NUMA node.
   * @param[in] meta_path This method creates a meta file at this path. It must not exist.
   * @param[in] size Byte size of the memory block.
   * @param[in] numa_node Where the physical memory is allocated. Negative for no preference.
   * @param[in] use_hugepages Whether to allocate the block from hugepages.
   * @details
   * The meta file is published with link(2) only after the block is ready, so another process
   * never sees a half-written meta file. If the meta file already exists, this returns
   * kErrorCodeSocShmAllocFailed with errno EEXIST and leaves the existing block alone.
   */
  ErrorStack  alloc(const std::string& meta_path, uint64_t size, int numa_node,
                    bool use_hugepages = false);
  /**
   * @brief Attach an already-allocated shared memory so that this object points to the memory.
   * @param[in] meta_path Path of the meta file written by alloc() of some process.
   * @details
   * This object does not hold the ownership. kErrorCodeSocShmAttachFailed if the meta file
   * is missing or the block is already gone.
   */
  ErrorStack  attach(const std::string& meta_path);

  /** Returns the path of the meta file. */
  const std::string& get_meta_path() const { return meta_path_; }
  /** Returns the memory block. */
  char*       get_block() const { return block_; }
  /** Returns the ID of this shared memory */
  int         get_shmid() const { return shmid_; }
  /** Returns the key of this shared memory */
  key_t       get_shmkey() const { return shmkey_; }
  /** Returns the ownership token. Held only in the process that called alloc(). */
  const OwnershipToken& get_owner_token() const { return owner_token_; }
  /** Returns if this object doesn't hold a valid memory block. */
  bool        is_null() const { return block_ == CXX11_NULLPTR; }
  /** Returns if this process owns this memory and is responsible to delete it. */
  bool        is_owned() const { return owner_token_.is_held(); }
  /** Returns the byte size of the memory block. */
  uint64_t    get_size() const { return size_; }
  /** Where the physical memory is allocated. */
  int         get_numa_node() const { return numa_node_; }

  /**
   * @brief Marks the shared memory as being removed so that it will be reclaimed when all
   * processes detach it.
   * @details
   * Does nothing unless this process holds the ownership token.
   * After this, no new process can attach, but attached processes keep their mappings.
   */
  void        mark_for_release();

  /**
   * @brief Detaches the memory block. If this process owns it, also marks it for release
   * and removes the meta file.
   */
  void        release_block();

  friend std::ostream&    operator<<(std::ostream& o, const SharedMemory& v);

 private:
  /** Path of the meta file */
  std::string     meta_path_;
  /** Byte size of the memory block. */
  uint64_t        size_;
  /** Where the physical memory is allocated. */
  int             numa_node_;
  /** Shared memory ID used for shmat/shmdt. */
  int             shmid_;
  /** Shared memory key used for shmget. */
  key_t           shmkey_;
  /** Held only in the process that created the block. */
  OwnershipToken  owner_token_;
  /** Allocated memory block. */
  char*           block_;
};

}  // namespace memory
}  // namespace cascache

#endif  // CASCACHE_MEMORY_SHARED_MEMORY_HPP_
