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
#ifndef CASCACHE_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
#define CASCACHE_DEBUGGING_DEBUGGING_SUPPORTS_HPP_

#include "cascache/cxx11.hpp"
#include "cascache/initializable.hpp"
#include "cascache/debugging/debugging_options.hpp"

namespace cascache {
namespace debugging {
/**
 * @brief Initializes glog with DebuggingOptions.
 * @ingroup DEBUGGING
 * @details
 * glog must be initialized only once per process. Every ContentCache owns one of this, and
 * a process-wide counter makes the first one initialize glog and the last one shut it down.
 */
class DebuggingSupports CXX11_FINAL : public DefaultInitializable {
 public:
  DebuggingSupports() CXX11_FUNC_DELETE;
  explicit DebuggingSupports(const DebuggingOptions& options) : options_(options) {}
  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

 private:
  void                initialize_glog();
  void                uninitialize_glog();

  const DebuggingOptions  options_;
};
}  // namespace debugging
}  // namespace cascache

#endif  // CASCACHE_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
