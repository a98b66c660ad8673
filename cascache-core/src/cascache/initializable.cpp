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
#include "cascache/initializable.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <typeinfo>

#include "cascache/assert_nd.hpp"
#include "cascache/assorted/assorted_func.hpp"

namespace cascache {
UninitializeGuard::~UninitializeGuard() {
  if (!target_->is_initialized()) {
    return;
  }
  if (policy_ != kSilent) {
    LOG(ERROR) << "UninitializeGuard has found that "
      << assorted::demangle_type_name(typeid(*target_).name())
      << "#uninitialize() was not called when it was destructed. This is a BUG!"
      << " We must call uninitialize() before destructors!";
  }
  if (policy_ == kAbortIfNotExplicitlyUninitialized) {
    LOG(FATAL) << "FATAL: According to kAbortIfNotExplicitlyUninitialized policy,"
      << " we abort the program" << std::endl;
    std::abort();
  }

  ErrorStack error = target_->uninitialize();
  // This is AFTER uninitialize(). The target might have been the last user of glog,
  // so we must use stderr here.
  if (error.is_error()) {
    switch (policy_) {
    case kAbortIfUninitializeError:
      std::cerr << "FATAL: UninitializeGuard encounters an error on uninitialize()."
        << " Aborting as we can't propagate this error appropriately."
        << " error=" << error << std::endl;
      std::abort();
      break;
    case kWarnIfUninitializeError:
      std::cerr << "WARN: UninitializeGuard encounters an error on uninitialize()."
        << " error=" << error << std::endl;
      break;
    default:
      ASSERT_ND(policy_ == kSilent);
    }
  }
}
}  // namespace cascache
