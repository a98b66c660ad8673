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
#ifndef CASCACHE_FS_FILESYSTEM_HPP_
#define CASCACHE_FS_FILESYSTEM_HPP_

#include <stdint.h>

#include <string>

#include "cascache/fs/path.hpp"

namespace cascache {
namespace fs {
/**
 * @defgroup FILESYSTEM Filesystem wrapper
 * @ingroup IDIOMS
 * @brief The few file operations the cache needs, in the manner of boost::filesystem.
 * @details
 * Files appear in exactly two places: the meta file that names a shared segment, and the XML
 * options file. Both are published with a rename or a link so that a concurrent reader sees
 * either nothing or the whole file.
 * The functions here return bool and leave errno as the system call set it.
 * Callers convert failures to ErrorStack with an error code of their own.
 */

/**
 * @brief What status() found at a path.
 * @ingroup FILESYSTEM
 */
enum FileType {
  kStatusError = 0,
  kFileNotFound,
  kRegularFile,
  kDirectoryFile,
  kTypeUnknown,
};

/**
 * @brief Analogue of boost::filesystem::file_status.
 * @ingroup FILESYSTEM
 */
struct FileStatus {
  FileStatus() : type_(kStatusError) {}
  explicit FileStatus(FileType type) : type_(type) {}

  bool exists() const { return type_ != kStatusError && type_ != kFileNotFound; }
  bool is_regular_file() const { return type_ == kRegularFile; }
  bool is_directory() const { return type_ == kDirectoryFile; }

  FileType type_;
};

/** stat(2) without following the error into errno handling. @ingroup FILESYSTEM */
FileStatus  status(const Path& p);
inline bool exists(const Path& p) { return status(p).exists(); }
inline bool is_directory(const Path& p) { return status(p).is_directory(); }
inline bool is_regular_file(const Path& p) { return status(p).is_regular_file(); }

/** getcwd(3), or an empty path if it fails. @ingroup FILESYSTEM */
Path        current_path();
/** $HOME, or an empty path. @ingroup FILESYSTEM */
Path        home_path();

/**
 * @brief mkdir -p.
 * @param[in] p the directory to create
 * @param[in] sync whether to fsync each created directory and its parent
 * @return true if the directory exists when this returns
 * @ingroup FILESYSTEM
 */
bool        create_directories(const Path& p, bool sync = false);

/** Deletes a regular file or an empty directory. @ingroup FILESYSTEM */
bool        remove(const Path& p);

/**
 * @brief Replaces each '%' in \b model with a random hex digit.
 * @param[in] model such as "%%%%_tmp"
 * @param[in] differentiator mixed into the seed, such as the pid or a counter
 * @ingroup FILESYSTEM
 */
std::string unique_name(const std::string& model, uint64_t differentiator = 0);

/**
 * @brief fsync(2) on a file or a directory.
 * @param[in] path the file or directory
 * @param[in] sync_parent_directory whether to also fsync the directory that contains it
 * @ingroup FILESYSTEM
 */
bool        fsync(const Path& path, bool sync_parent_directory = false);

/**
 * @brief Replaces \b new_path with \b old_path so that it survives a crash.
 * @details
 * fsync() on the file, rename(2), then fsync() on the parent directory.
 * Readers see either the old or the new content, never a partial file.
 * @ingroup FILESYSTEM
 */
bool        durable_atomic_rename(const Path& old_path, const Path& new_path);

/**
 * @brief Makes \b new_path another name of \b old_path, failing with EEXIST if it exists.
 * @details
 * Unlike rename(2), this never replaces an existing file. When two processes race to publish
 * a file at the same path, exactly one of them wins.
 * @ingroup FILESYSTEM
 */
bool        link_exclusive(const Path& old_path, const Path& new_path);

}  // namespace fs
}  // namespace cascache

#endif  // CASCACHE_FS_FILESYSTEM_HPP_
