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
#include "cascache/debugging/debugging_supports.hpp"

#include <glog/logging.h>
#include <glog/vlog_is_on.h>

#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>

#include "cascache/assert_nd.hpp"

namespace cascache {
namespace debugging {

namespace {
/**
 * @brief Number of DebuggingSupports that currently use glog in this process.
 * @details
 * glog can be initialized only once per process, but a process may attach to several caches.
 * The first one to come initializes glog and the last one to leave shuts it down.
 * These two are the only static variables of the library.
 */
int         glog_users = 0;
std::mutex  glog_users_lock;

/** Applies a list like "compactor=2,sampled_lru_evictor=1" with google::SetVLOGLevel(). */
void apply_verbose_modules(const std::string& modules) {
  std::stringstream list(modules);
  std::string entry;
  while (std::getline(list, entry, ',')) {
    size_t equal = entry.find('=');
    if (equal == std::string::npos || equal == 0) {
      LOG(WARNING) << "Ignored a malformed entry in verbose_modules_: '" << entry << "'";
      continue;
    }
    int level = std::atoi(entry.c_str() + equal + 1);
    google::SetVLOGLevel(entry.substr(0, equal).c_str(), level);
  }
}
}  // namespace

void DebuggingSupports::initialize_glog() {
  std::lock_guard<std::mutex> guard(glog_users_lock);
  ASSERT_ND(glog_users >= 0);
  if (glog_users++ > 0) {
    LOG(INFO) << "initialize_glog(): glog is already initialized in this process";
    return;
  }
  FLAGS_logtostderr = options_.debug_log_to_stderr_;
  FLAGS_stderrthreshold = static_cast<int>(options_.debug_log_stderr_threshold_);
  FLAGS_minloglevel = static_cast<int>(options_.debug_log_min_threshold_);
  FLAGS_log_dir = options_.debug_log_dir_;  // must be set before InitGoogleLogging()
  FLAGS_v = options_.verbose_log_level_;
  // glog keeps the pointer without copying
  google::InitGoogleLogging("libcascache");
  if (!options_.verbose_modules_.empty()) {
    apply_verbose_modules(options_.verbose_modules_);
  }
  LOG(INFO) << "initialize_glog(): Initialized glog";
}

void DebuggingSupports::uninitialize_glog() {
  std::lock_guard<std::mutex> guard(glog_users_lock);
  ASSERT_ND(glog_users >= 1);
  if (--glog_users > 0) {
    LOG(INFO) << "uninitialize_glog(): " << glog_users << " more users of glog remain";
    return;
  }
  LOG(INFO) << "uninitialize_glog(): Shutting down glog";
  google::ShutdownGoogleLogging();
}

ErrorStack DebuggingSupports::initialize_once() {
  initialize_glog();  // we can use glog since now
  return kRetOk;
}

ErrorStack DebuggingSupports::uninitialize_once() {
  uninitialize_glog();  // we can't use glog since now
  return kRetOk;
}

}  // namespace debugging
}  // namespace cascache
