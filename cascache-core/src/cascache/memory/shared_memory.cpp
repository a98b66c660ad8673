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
#include "cascache/memory/shared_memory.hpp"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <valgrind.h>  // just for RUNNING_ON_VALGRIND macro.
#include <sys/ipc.h>
#include <sys/shm.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include "cascache/assert_nd.hpp"
#include "cascache/assorted/assorted_func.hpp"
#include "cascache/debugging/stop_watch.hpp"
#include "cascache/fs/filesystem.hpp"
#include "cascache/memory/memory_id.hpp"

namespace cascache {
namespace memory {

// Note, we can't use glog in this file because shared memory is used before glog is initialized
// (the cache lock itself usually lives in a SharedMemory allocated by the application).

const uint64_t kHugepageSize = 1ULL << 21;

bool OwnershipToken::is_held() const {
  return owner_pid_ != 0 && owner_pid_ == ::getpid();
}

SharedMemory::SharedMemory(SharedMemory &&other) noexcept : block_(nullptr) {
  *this = std::move(other);
}
SharedMemory& SharedMemory::operator=(SharedMemory &&other) noexcept {
  release_block();
  meta_path_ = other.meta_path_;
  size_ = other.size_;
  numa_node_ = other.numa_node_;
  shmid_ = other.shmid_;
  shmkey_ = other.shmkey_;
  owner_token_ = std::move(other.owner_token_);
  block_ = other.block_;
  other.block_ = nullptr;
  return *this;
}

ErrorStack SharedMemory::alloc(
  const std::string& meta_path,
  uint64_t size,
  int numa_node,
  bool use_hugepages) {
  release_block();
  meta_path_.clear();
  shmid_ = 0;
  shmkey_ = 0;
  if (size == 0) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, "size of shared memory must be positive");
  }

  // if this is running under valgrind, we have to avoid using hugepages due to a bug in valgrind.
  // see https://bugs.kde.org/show_bug.cgi?id=338995
  bool hugepages = use_hugepages && !RUNNING_ON_VALGRIND;
  if (hugepages && size % kHugepageSize != 0) {
    size = ((size / kHugepageSize) + 1ULL) * kHugepageSize;
  }

  if (fs::exists(fs::Path(meta_path))) {
    errno = EEXIST;
    std::string msg = std::string("Shared memory meta file already exists:") + meta_path;
    return ERROR_STACK_MSG(kErrorCodeSocShmAllocFailed, msg.c_str());
  }

  // randomly generate shmkey. ftok() occasionally gives lots of conflicts,
  // so we just use pid and a clock. Retry on the unlikely conflict with an existing key.
  pid_t the_pid = ::getpid();
  ScopedNumaPreferred numa_scope(numa_node, true);
  for (int retry = 0; retry < 16; ++retry) {
    uint64_t key64 = (debugging::get_now_nanosec() * 0x9E3779B97F4A7C15ULL) ^ the_pid ^ retry;
    key_t the_key = static_cast<key_t>((key64 >> 32) ^ key64);
    if (the_key == 0 || the_key == IPC_PRIVATE) {
      continue;
    }
    int flags = IPC_CREAT | IPC_EXCL | S_IRUSR | S_IWUSR | (hugepages ? SHM_HUGETLB : 0);
    shmid_ = ::shmget(the_key, size, flags);
    if (shmid_ != -1) {
      shmkey_ = the_key;
      break;
    } else if (errno != EEXIST) {
      break;
    }
  }
  if (shmid_ == -1 || shmkey_ == 0) {
    std::string msg = std::string("shmget() failed! size=") + std::to_string(size)
      + std::string(", os_error=") + assorted::os_error() + std::string(", meta_path=") + meta_path;
    shmid_ = 0;
    shmkey_ = 0;
    return ERROR_STACK_MSG(kErrorCodeSocShmAllocFailed, msg.c_str());
  }

  size_ = size;
  numa_node_ = numa_node;
  owner_token_ = OwnershipToken(the_pid);

  block_ = reinterpret_cast<char*>(::shmat(shmid_, nullptr, 0));
  if (block_ == reinterpret_cast<void*>(-1)) {
    ::shmctl(shmid_, IPC_RMID, nullptr);  // first thing. release it! before everything else.
    block_ = nullptr;
    std::stringstream msg;
    msg << "shmat alloc failed!" << *this << ", error=" << assorted::os_error();
    owner_token_.relinquish();
    std::string str = msg.str();
    return ERROR_STACK_MSG(kErrorCodeSocShmAllocFailed, str.c_str());
  }

  std::memset(block_, 0, size_);

  // Write out the size/node/shmkey in a temporary file, then publish it with link(2),
  // which fails if someone else has published a meta file at the same path meanwhile.
  std::string tmp_path = meta_path + ".tmp_" + fs::unique_name("%%%%%%%%", the_pid);
  {
    std::ofstream file(tmp_path.c_str(), std::ofstream::binary);
    if (!file.is_open()) {
      std::string msg = std::string("Failed to create shared memory meta file:") + tmp_path;
      release_block();
      return ERROR_STACK_MSG(kErrorCodeSocShmAllocFailed, msg.c_str());
    }
    uint64_t size_copy = size_;
    int32_t numa_copy = numa_node_;
    int32_t key_copy = shmkey_;
    file.write(reinterpret_cast<char*>(&size_copy), sizeof(size_copy));
    file.write(reinterpret_cast<char*>(&numa_copy), sizeof(numa_copy));
    file.write(reinterpret_cast<char*>(&key_copy), sizeof(key_copy));
    file.flush();
    file.close();
    if (!file) {
      std::remove(tmp_path.c_str());
      std::string msg = std::string("Failed to write shared memory meta file:") + tmp_path;
      release_block();
      return ERROR_STACK_MSG(kErrorCodeSocShmAllocFailed, msg.c_str());
    }
  }
  bool published = fs::link_exclusive(fs::Path(tmp_path), fs::Path(meta_path));
  int link_errno = errno;
  fs::remove(fs::Path(tmp_path));
  if (!published) {
    // Not ours to remove. Detach and destroy only our block.
    std::string msg = std::string("Failed to publish shared memory meta file:") + meta_path
      + ", os_error=" + assorted::os_error(link_errno);
    release_block();
    errno = link_errno;
    return ERROR_STACK_MSG(kErrorCodeSocShmAllocFailed, msg.c_str());
  }
  meta_path_ = meta_path;
  return kRetOk;
}

ErrorStack SharedMemory::attach(const std::string& meta_path) {
  release_block();
  meta_path_.clear();
  shmid_ = 0;
  shmkey_ = 0;
  if (!fs::exists(fs::Path(meta_path))) {
    std::string msg = std::string("Shared memory meta file does not exist:") + meta_path;
    return ERROR_STACK_MSG(kErrorCodeSocShmAttachFailed, msg.c_str());
  }
  std::ifstream file(meta_path.c_str(), std::ifstream::binary);
  if (!file.is_open()) {
    std::string msg = std::string("Failed to open shared memory meta file:") + meta_path;
    return ERROR_STACK_MSG(kErrorCodeSocShmAttachFailed, msg.c_str());
  }
  uint64_t shared_size = 0;
  int32_t numa_node = 0;
  int32_t the_key = 0;
  file.read(reinterpret_cast<char*>(&shared_size), sizeof(shared_size));
  file.read(reinterpret_cast<char*>(&numa_node), sizeof(numa_node));
  file.read(reinterpret_cast<char*>(&the_key), sizeof(the_key));
  bool read_ok = static_cast<bool>(file);
  file.close();

  if (!read_ok || shared_size == 0 || the_key == 0) {
    std::stringstream msg;
    msg << "Shared memory meta file is broken:" << meta_path << ". size=" << shared_size
      << ", shmkey=" << the_key;
    std::string str = msg.str();
    return ERROR_STACK_MSG(kErrorCodeSocShmMetaCorrupted, str.c_str());
  }

  shmid_ = ::shmget(static_cast<key_t>(the_key), shared_size, 0);
  if (shmid_ == -1) {
    shmid_ = 0;
    std::string msg = std::string("shmget() attach failed! size=") + std::to_string(shared_size)
      + ", error=" + assorted::os_error() + ", meta_path=" + meta_path;
    return ERROR_STACK_MSG(kErrorCodeSocShmAttachFailed, msg.c_str());
  }

  size_ = shared_size;
  numa_node_ = numa_node;
  meta_path_ = meta_path;
  shmkey_ = static_cast<key_t>(the_key);
  owner_token_.relinquish();

  block_ = reinterpret_cast<char*>(::shmat(shmid_, nullptr, 0));
  if (block_ == reinterpret_cast<void*>(-1)) {
    block_ = nullptr;
    std::stringstream msg;
    msg << "shmat attach failed!" << *this << ", error=" << assorted::os_error();
    std::string str = msg.str();
    return ERROR_STACK_MSG(kErrorCodeSocShmAttachFailed, str.c_str());
  }
  return kRetOk;
}

void SharedMemory::mark_for_release() {
  if (block_ != nullptr && shmid_ != 0 && owner_token_.is_held()) {
    // Linux allows shmat() after shmctl(IPC_RMID), but not shmget().
    // So no new process can attach from now on.
    ::shmctl(shmid_, IPC_RMID, nullptr);
  }
}

void SharedMemory::release_block() {
  if (block_ != nullptr) {
    bool owned = owner_token_.is_held();
    if (owned) {
      mark_for_release();
    }

    // Just detach it. linux will release it once the reference count reaches zero.
    int dt_ret = ::shmdt(block_);
    if (dt_ret == -1) {
      std::cerr << "shmdt() failed." << *this << ", error=" << assorted::os_error() << std::endl;
    }

    block_ = nullptr;

    if (owned && !meta_path_.empty()) {
      std::remove(meta_path_.c_str());
    }
  }
  owner_token_.relinquish();
}

std::ostream& operator<<(std::ostream& o, const SharedMemory& v) {
  o << "<SharedMemory>";
  o << "<meta_path>" << v.get_meta_path() << "</meta_path>";
  o << "<size>" << v.get_size() << "</size>";
  o << "<owned>" << v.is_owned() << "</owned>";
  o << "<owner_pid>" << v.get_owner_token().get_owner_pid() << "</owner_pid>";
  o << "<numa_node>" << v.get_numa_node() << "</numa_node>";
  o << "<shmid>" << v.get_shmid() << "</shmid>";
  o << "<shmkey>" << v.get_shmkey() << "</shmkey>";
  o << "<address>" << reinterpret_cast<uintptr_t>(v.get_block()) << "</address>";
  o << "</SharedMemory>";
  return o;
}

}  // namespace memory
}  // namespace cascache
