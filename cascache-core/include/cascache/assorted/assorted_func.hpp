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
#ifndef CASCACHE_ASSORTED_ASSORTED_FUNC_HPP_
#define CASCACHE_ASSORTED_ASSORTED_FUNC_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <typeinfo>

namespace cascache {
namespace assorted {

/**
 * @brief Returns the smallest multiply of ALIGNMENT that is equal or larger than the given number.
 * @ingroup ASSORTED
 * @tparam T integer type
 * @tparam ALIGNMENT alignment size. must be power of two
 * @details
 * In other words, round-up. For example of 8-alignment, 7 becomes 8, 8 becomes 8, 9 becomes 16.
 */
template <typename T, unsigned int ALIGNMENT>
inline T align(T value) {
  return static_cast<T>((value + ALIGNMENT - 1) & (-static_cast<T>(ALIGNMENT)));
}

/**
 * 8-alignment. Blob records are 8-aligned.
 * @ingroup ASSORTED
 */
template <typename T> inline T align8(T value) { return align<T, 8>(value); }

/**
 * Thread-safe strerror(errno).
 * @ingroup ASSORTED
 */
std::string os_error();

/**
 * This version receives errno.
 * @ingroup ASSORTED
 */
std::string os_error(int error_number);

/**
 * @brief Returns the full path of current executable.
 * @ingroup ASSORTED
 * @details
 * This relies on linux /proc/self/exe. Testcases use it to spawn themselves.
 */
std::string get_current_executable_path();

/**
 * @brief Convenient way of writing hex integers to stream.
 * @ingroup ASSORTED
 * @details
 * @code{.cpp}
 * std::cout << Hex(1234) << ...
 * // same output as:
 * // std::cout << "0x" << std::hex << std::uppercase << 1234 << std::nouppercase << std::dec << ...
 * @endcode
 */
struct Hex {
  template<typename T>
  Hex(T val, int fix_digits = -1) : val_(static_cast<uint64_t>(val)), fix_digits_(fix_digits) {}

  uint64_t val_;
  int fix_digits_;
  friend std::ostream& operator<<(std::ostream& o, const Hex& v);
};

/**
 * @brief Writes a byte sequence as hex to stream, up to max_bytes bytes.
 * @ingroup ASSORTED
 * @details
 * Keys and values of the cache are arbitrary bytes, so we never print them raw in logs.
 * @code{.cpp}
 * LOG(INFO) << "key=" << HexString(key, 16);
 * // outputs "key=0x6B6579 (3 bytes)"
 * @endcode
 */
struct HexString {
  HexString(const std::string& str, uint32_t max_bytes = 64U)
    : str_(str), max_bytes_(max_bytes) {}

  const std::string&  str_;
  uint32_t            max_bytes_;
  friend std::ostream& operator<<(std::ostream& o, const HexString& v);
};

/**
 * @brief Demangle the given C++ type name \e if possible (otherwise the original string).
 * @ingroup ASSORTED
 */
std::string demangle_type_name(const char* mangled_name);

/**
 * @brief Returns the name of the C++ type as readable as possible.
 * @ingroup ASSORTED
 * @tparam T the type
 */
template <typename T>
std::string get_pretty_type_name() {
  return demangle_type_name(typeid(T).name());
}

}  // namespace assorted
}  // namespace cascache

#endif  // CASCACHE_ASSORTED_ASSORTED_FUNC_HPP_
