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
#include "cascache/error_stack.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "cascache/assert_nd.hpp"
#include "cascache/assorted/assorted_func.hpp"

namespace cascache {

void ErrorStack::output(std::ostream* ptr) const {
  std::ostream &o = *ptr;
  if (!is_error()) {
    o << "No error";
    return;
  }
  o << get_error_name(error_code_) << "(" << error_code_ << "):" << get_message();
  if (os_errno_ != 0) {
    o << " (Latest system call error=" << assorted::os_error(os_errno_) << ")";
  }
  if (custom_message_) {
    o << " (Additional message=" << custom_message_ << ")";
  }
  for (uint16_t i = 0; i < stack_depth_; ++i) {
    o << std::endl << "  " << frames_[i].file_ << ":" << frames_[i].line_ << ": ";
    if (frames_[i].func_) {
      o << frames_[i].func_ << "()";
    }
  }
  if (stack_depth_ >= kMaxStackDepth) {
    o << std::endl << "  .. and more frames that didn't fit in kMaxStackDepth";
  }
}

void ErrorStack::dump_and_abort(const char *abort_message) const {
  std::stringstream str;
  str << "ErrorStack::dump_and_abort: " << abort_message << std::endl
    << *this << std::endl << print_backtrace();
  LOG(FATAL) << str.str();
  std::abort();
}

std::ostream& operator<<(std::ostream& o, const ErrorStack& obj) {
  obj.output(&o);
  return o;
}

}  // namespace cascache
