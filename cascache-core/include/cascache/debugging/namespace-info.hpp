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
#ifndef CASCACHE_DEBUGGING_NAMESPACE_INFO_HPP_
#define CASCACHE_DEBUGGING_NAMESPACE_INFO_HPP_

/**
 * @namespace cascache::debugging
 * @brief Debug-logging and timing.
 * @details
 * @par Debug-Logging
 * We use glog for debug-logging.
 * DebuggingSupports initializes glog once per process, however many caches the process opens.
 * Use LOG(INFO)/LOG(WARNING)/LOG(ERROR) and VLOG(n) as usual.
 * Never log the bytes of keys or values as text. Use assorted::HexString.
 *
 * @par Timing
 * get_now_nanosec() gives the timestamps stored in key entries, and StopWatch measures
 * maintenance operations for log messages.
 */

/**
 * @defgroup DEBUGGING Debug-logging and timing
 * @ingroup IDIOMS
 * @copydoc cascache::debugging
 */

#endif  // CASCACHE_DEBUGGING_NAMESPACE_INFO_HPP_
