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
#ifndef CASCACHE_DEBUGGING_DEBUGGING_OPTIONS_HPP_
#define CASCACHE_DEBUGGING_DEBUGGING_OPTIONS_HPP_

#include <stdint.h>

#include <string>

#include "cascache/cxx11.hpp"
#include "cascache/externalize/externalizable.hpp"

namespace cascache {
namespace debugging {
/**
 * @brief How a process that uses the cache writes its glog output.
 * @ingroup DEBUGGING
 * @details
 * glog is process-wide, so only the first DebuggingSupports that initializes in the process
 * applies these. Every element is optional in XML.
 */
struct DebuggingOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /** Same values as glog's severities. */
  enum DebugLogLevel {
    kDebugLogInfo = 0,
    kDebugLogWarning,
    kDebugLogError,
    /** Logging at this level aborts the process. */
    kDebugLogFatal,
  };

  DebuggingOptions();

  /** Write debug logs to stderr instead of files under debug_log_dir_. Default false. */
  bool            debug_log_to_stderr_;

  /** Logs at or above this level are also copied to stderr. Default kDebugLogWarning. */
  DebugLogLevel   debug_log_stderr_threshold_;

  /** Logs below this level are dropped. Default kDebugLogInfo. */
  DebugLogLevel   debug_log_min_threshold_;

  /**
   * @brief VLOG(m) with m at or below this number are shown. Default 0.
   * @details
   * Eviction decisions are VLOG(1), per-blob compaction moves are VLOG(2).
   */
  int16_t         verbose_log_level_;

  /**
   * Per-module verbose level for google::SetVLOGLevel, such as
   * "compactor=2,sampled_lru_evictor=1". Default "".
   */
  std::string     verbose_modules_;

  /** Folder of the log files. Default "/tmp". */
  std::string     debug_log_dir_;

  EXTERNALIZABLE(DebuggingOptions);
};
}  // namespace debugging
}  // namespace cascache

#endif  // CASCACHE_DEBUGGING_DEBUGGING_OPTIONS_HPP_
