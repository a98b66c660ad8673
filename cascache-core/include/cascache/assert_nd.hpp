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
#ifndef CASCACHE_ASSERT_ND_HPP_
#define CASCACHE_ASSERT_ND_HPP_

#include <string>

/**
 * @def ASSERT_ND(x)
 * @ingroup IDIOMS
 * @brief assert() that compiles to nothing in release mode, without unused-variable warnings.
 * @details
 * In release mode we use (void) sizeof(x), which never evaluates x.
 * In debug mode a failed assertion prints the expression and the backtrace to stderr and
 * leaves them in a global so that the signal handler of the testcases can report them.
 * ASSERT_ND is only for invariants of our own code. Anything the shared segment or the
 * caller can violate (corrupted bytes, bad arguments) must be an ErrorCode instead.
 */
/**
 * @def UNUSED_ND(var)
 * @ingroup IDIOMS
 * @brief Marks a variable used only in ASSERT_ND.
 */
namespace cascache {
  /** Helper function to report what assertion failed. */
  std::string print_assert(const char* file, const char* func, int line, const char* description);
  /** Prints out backtrace. Best-effort, symbols are mangled where backtrace_symbols can't help. */
  std::string print_backtrace();

  /**
   * print_assert() + print_backtrace().
   * It also leaves the info in a global variable so that signal handler can show that later.
   */
  void print_assert_backtrace(
    const char* file,
    const char* func,
    int line,
    const char* description);

  /** Retrieves the info left by print_assert_backtrace(). Called by signal handler */
  std::string get_recent_assert_backtrace();
}  // namespace cascache

#ifdef NDEBUG
#define ASSERT_ND(x) do { (void) sizeof(x); } while (0)
#define UNUSED_ND(var) ASSERT_ND(var)
#else  // NDEBUG
#include <cassert>
#define ASSERT_QUOTE(str) #str
#define ASSERT_ND(x) do { if (!(x)) { \
  cascache::print_assert_backtrace(__FILE__, __FUNCTION__, __LINE__, ASSERT_QUOTE(x)); \
  assert(x); \
  } } while (0)
#define UNUSED_ND(var)
#endif  // NDEBUG

#endif  // CASCACHE_ASSERT_ND_HPP_
