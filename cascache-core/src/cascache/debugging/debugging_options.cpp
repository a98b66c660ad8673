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
#include "cascache/debugging/debugging_options.hpp"

#include "cascache/externalize/externalizable.hpp"

namespace cascache {
namespace debugging {
DebuggingOptions::DebuggingOptions()
  : debug_log_to_stderr_(false),
    debug_log_stderr_threshold_(kDebugLogWarning),
    debug_log_min_threshold_(kDebugLogInfo),
    verbose_log_level_(0),
    verbose_modules_(""),
    debug_log_dir_("/tmp") {
}

ErrorStack DebuggingOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, debug_log_to_stderr_, false);
  EXTERNALIZE_LOAD_ENUM_ELEMENT_OPTIONAL(element, debug_log_stderr_threshold_, kDebugLogWarning);
  EXTERNALIZE_LOAD_ENUM_ELEMENT_OPTIONAL(element, debug_log_min_threshold_, kDebugLogInfo);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, verbose_log_level_, static_cast<int16_t>(0));
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, verbose_modules_, "");
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, debug_log_dir_, "/tmp");
  if (debug_log_stderr_threshold_ < kDebugLogInfo || debug_log_stderr_threshold_ > kDebugLogFatal
    || debug_log_min_threshold_ < kDebugLogInfo || debug_log_min_threshold_ > kDebugLogFatal) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "DebugLogLevel must be 0-3");
  }
  return kRetOk;
}

ErrorStack DebuggingOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "How this process writes debug logs (glog).\n"
    " enum DebugLogLevel: 0 = info, 1 = warning, 2 = error, 3 = fatal (aborts)"));

  EXTERNALIZE_SAVE_ELEMENT(element, debug_log_to_stderr_,
    "Write debug logs to stderr instead of files");
  EXTERNALIZE_SAVE_ENUM_ELEMENT(element, debug_log_stderr_threshold_,
    "Logs at or above this level are also copied to stderr");
  EXTERNALIZE_SAVE_ENUM_ELEMENT(element, debug_log_min_threshold_,
    "Logs below this level are dropped");
  EXTERNALIZE_SAVE_ELEMENT(element, verbose_log_level_,
    "VLOG(m) with m at or below this number are shown");
  EXTERNALIZE_SAVE_ELEMENT(element, verbose_modules_,
    "Per-module verbose level, such as compactor=2,sampled_lru_evictor=1");
  EXTERNALIZE_SAVE_ELEMENT(element, debug_log_dir_, "Folder of the log files");
  return kRetOk;
}

}  // namespace debugging
}  // namespace cascache
