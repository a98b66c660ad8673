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
#include "cascache/fs/filesystem.hpp"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "cascache/fs/path.hpp"

namespace cascache {
namespace fs {

namespace {
/** fsync(2) on an open descriptor of a file or a directory. */
bool fsync_descriptor_of(const Path& path) {
  int descriptor = ::open(path.c_str(), O_RDONLY | (is_directory(path) ? O_DIRECTORY : 0));
  if (descriptor < 0) {
    return false;
  }
  int ret = ::fsync(descriptor);
  int fsync_errno = errno;
  ::close(descriptor);
  errno = fsync_errno;
  return ret == 0;
}
}  // namespace

FileStatus status(const Path& p) {
  struct stat path_stat;
  if (::stat(p.c_str(), &path_stat) != 0) {
    return FileStatus(errno == ENOENT || errno == ENOTDIR ? kFileNotFound : kStatusError);
  }
  if (S_ISDIR(path_stat.st_mode)) {
    return FileStatus(kDirectoryFile);
  } else if (S_ISREG(path_stat.st_mode)) {
    return FileStatus(kRegularFile);
  }
  return FileStatus(kTypeUnknown);
}

Path current_path() {
  std::vector<char> buf(256);
  while (::getcwd(&buf[0], buf.size()) == nullptr) {
    if (errno != ERANGE) {
      return Path();
    }
    buf.resize(buf.size() * 2);
  }
  return Path(std::string(&buf[0]));
}

Path home_path() {
  const char *home = ::getenv("HOME");
  return home ? Path(std::string(home)) : Path();
}

bool create_directories(const Path& p, bool sync) {
  if (exists(p)) {
    return is_directory(p);
  }
  Path parent = p.parent_path();
  if (!parent.empty() && !create_directories(parent, sync)) {
    return false;
  }
  if (::mkdir(p.c_str(), S_IRWXU) != 0) {
    // someone else might have created it meanwhile
    return errno == EEXIST && is_directory(p);
  }
  return !sync || fsync(p, true);
}

bool remove(const Path& p) {
  FileStatus s = status(p);
  if (!s.exists()) {
    return false;
  } else if (s.is_directory()) {
    return ::rmdir(p.c_str()) == 0;
  }
  return std::remove(p.c_str()) == 0;
}

std::string unique_name(const std::string& model, uint64_t differentiator) {
  const char* kHexChars = "0123456789abcdef";
  uint64_t seed64 = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  seed64 += ::getpid();
  seed64 ^= differentiator;
  uint32_t seed32 = (seed64 >> 32) ^ seed64;
  std::string s(model);
  for (std::string::iterator it = s.begin(); it != s.end(); ++it) {
    if (*it == '%') {
      seed32 = ::rand_r(&seed32);
      *it = kHexChars[seed32 & 0xf];
    }
  }
  return s;
}

bool fsync(const Path& path, bool sync_parent_directory) {
  if (!fsync_descriptor_of(path)) {
    return false;
  }
  if (sync_parent_directory && path.has_parent_path()) {
    return fsync_descriptor_of(path.parent_path());
  }
  return true;
}

bool durable_atomic_rename(const Path& old_path, const Path& new_path) {
  return fsync(old_path, false)
    && ::rename(old_path.c_str(), new_path.c_str()) == 0
    && fsync(new_path.parent_path(), false);
}

bool link_exclusive(const Path& old_path, const Path& new_path) {
  return ::link(old_path.c_str(), new_path.c_str()) == 0;
}

}  // namespace fs
}  // namespace cascache
