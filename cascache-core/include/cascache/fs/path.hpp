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
#ifndef CASCACHE_FS_PATH_HPP_
#define CASCACHE_FS_PATH_HPP_

#include <iosfwd>
#include <string>

namespace cascache {
namespace fs {
/**
 * @brief An absolute file path, in the manner of boost::filesystem::path.
 * @ingroup FILESYSTEM
 * @details
 * The constructor resolves "~" and relative paths right away. The meta file of a shared
 * segment is looked up by every attaching process, and a relative path must not resolve
 * differently in a process with another working directory.
 */
class Path {
 public:
  static const char kSeparator = '/';

  Path() {}
  /** Resolves ~ at beginning, and a relative path against the current directory. */
  explicit Path(const std::string& s);

  Path& operator+=(const std::string& s) {
    pathname_ += s;
    return *this;
  }
  /** Appends a component, adding a separator in between if needed. */
  Path& operator/=(const std::string& component) {
    if (!pathname_.empty() && pathname_[pathname_.size() - 1] != kSeparator) {
      pathname_ += kSeparator;
    }
    pathname_ += component;
    return *this;
  }

  const char*         c_str()  const { return pathname_.c_str(); }
  const std::string&  string() const { return pathname_; }
  bool                empty() const { return pathname_.empty(); }

  /** Empty for "/" and for an empty path. */
  Path        parent_path() const;
  bool        has_parent_path() const { return !parent_path().empty(); }
  /** The last component, without the separator. */
  std::string filename() const;

  friend bool operator==(const Path& lhs, const Path& rhs) {
    return lhs.pathname_ == rhs.pathname_;
  }
  friend bool operator!=(const Path& lhs, const Path& rhs) { return !(lhs == rhs); }
  friend std::ostream& operator<<(std::ostream& o, const Path& v);

 private:
  std::string pathname_;
};

}  // namespace fs
}  // namespace cascache

#endif  // CASCACHE_FS_PATH_HPP_
