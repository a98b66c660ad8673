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
#include "cascache/fs/path.hpp"

#include <ostream>
#include <string>

#include "cascache/fs/filesystem.hpp"

namespace cascache {
namespace fs {

Path::Path(const std::string& s) {
  const bool home_relative = !s.empty() && s[0] == '~' && (s.size() == 1 || s[1] == kSeparator);
  if (home_relative) {
    pathname_ = home_path().string() + s.substr(1);
  } else if (!s.empty() && s[0] != kSeparator) {
    Path absolute = current_path();
    absolute /= s;
    pathname_ = absolute.pathname_;
  } else {
    pathname_ = s;
  }
}

Path Path::parent_path() const {
  if (pathname_.size() <= 1) {
    return Path();
  }
  size_t pos = pathname_.find_last_of(kSeparator);
  if (pos == std::string::npos) {
    return Path();
  }
  Path parent;
  parent.pathname_ = pos == 0 ? std::string(1, kSeparator) : pathname_.substr(0, pos);
  return parent;
}

std::string Path::filename() const {
  size_t pos = pathname_.find_last_of(kSeparator);
  return pos == std::string::npos ? pathname_ : pathname_.substr(pos + 1);
}

std::ostream& operator<<(std::ostream& o, const Path& v) {
  o << v.string();
  return o;
}

}  // namespace fs
}  // namespace cascache
