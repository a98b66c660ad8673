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
#include "cascache/assorted/assorted_func.hpp"

#ifdef __GNUC__  // for get_pretty_type_name()
#include <cxxabi.h>
#endif  // __GNUC__
#include <errno.h>
#include <stdint.h>
#include <string.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace cascache {
namespace assorted {

std::string os_error() {
  return os_error(errno);
}

std::string os_error(int error_number) {
  if (error_number == 0) {
    return "[No Error]";
  }
  char buf[256];
  buf[0] = '\0';
  // GNU strerror_r may return a static string instead of filling buf.
#if defined(_GNU_SOURCE)
  const char* message = ::strerror_r(error_number, buf, sizeof(buf));
#else  // defined(_GNU_SOURCE)
  const char* message = ::strerror_r(error_number, buf, sizeof(buf)) == 0 ? buf : "Unknown";
#endif  // defined(_GNU_SOURCE)
  std::stringstream str;
  str << "[Errno " << error_number << "] " << message;
  return str.str();
}

std::string get_current_executable_path() {
  char buf[1024];
  ssize_t len = ::readlink("/proc/self/exe", buf, sizeof(buf));
  if (len == -1) {
    std::cerr << "Failed to get the path of current executable. error=" << os_error() << std::endl;
    return "";
  }
  return std::string(buf, len);
}

std::ostream& operator<<(std::ostream& o, const Hex& v) {
  std::ios::fmtflags old_flags = o.flags();
  char old_fill = o.fill();
  o << "0x";
  if (v.fix_digits_ >= 0) {
    o.width(v.fix_digits_);
    o.fill('0');
  }
  o << std::hex << std::uppercase << v.val_;
  o.flags(old_flags);
  o.fill(old_fill);
  return o;
}

std::ostream& operator<<(std::ostream& o, const HexString& v) {
  std::ios::fmtflags old_flags = o.flags();
  char old_fill = o.fill();
  o << "0x" << std::hex << std::uppercase;
  o.fill('0');
  for (uint32_t i = 0; i < v.str_.size() && i < v.max_bytes_; ++i) {
    if (i > 0 && i % 8U == 0) {
      o << " ";  // put space for every 8 bytes for readability
    }
    o.width(2);
    o << static_cast<uint16_t>(static_cast<uint8_t>(v.str_[i]));
  }
  o.flags(old_flags);
  o.fill(old_fill);
  if (v.str_.size() > v.max_bytes_) {
    o << " ...(" << (v.str_.size() - v.max_bytes_) << " more bytes)";
  } else {
    o << " (" << v.str_.size() << " bytes)";
  }
  return o;
}

std::string demangle_type_name(const char* mangled_name) {
#ifdef __GNUC__
  int status;
  char* demangled = abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status);
  if (demangled) {
    std::string ret(demangled);
    ::free(demangled);
    return ret;
  }
#endif  // __GNUC__
  return mangled_name;
}

}  // namespace assorted
}  // namespace cascache
