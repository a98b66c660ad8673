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
#ifndef CASCACHE_DEBUGGING_STOP_WATCH_HPP_
#define CASCACHE_DEBUGGING_STOP_WATCH_HPP_

#include <stdint.h>

namespace cascache {
namespace debugging {

/**
 * @brief Wall-clock time in nanoseconds since the UNIX epoch (CLOCK_REALTIME).
 * @ingroup DEBUGGING
 * @details
 * Key entries store this as the last-access timestamp. Every process attached to a segment
 * must see the same clock, so this is not a per-process or per-boot clock.
 */
uint64_t get_now_nanosec();

/** Nanoseconds of CLOCK_MONOTONIC. Only differences are meaningful. @ingroup DEBUGGING */
uint64_t get_monotonic_nanosec();

/**
 * @brief Measures elapsed time on CLOCK_MONOTONIC. Starts on construction.
 * @ingroup DEBUGGING
 */
class StopWatch {
 public:
  StopWatch() { start(); }

  void        start() { started_ = stopped_ = get_monotonic_nanosec(); }

  /** Returns elapsed nanosec. */
  uint64_t    stop() {
    stopped_ = get_monotonic_nanosec();
    return elapsed_ns();
  }

  /** Elapsed nanosec since start(), without stopping. */
  uint64_t    peek_elapsed_ns() const { return get_monotonic_nanosec() - started_; }

  uint64_t    elapsed_ns() const { return stopped_ - started_; }
  double      elapsed_us() const { return static_cast<double>(elapsed_ns()) / 1000.0; }
  double      elapsed_ms() const { return static_cast<double>(elapsed_ns()) / 1000000.0; }

 private:
  uint64_t started_;
  uint64_t stopped_;
};

}  // namespace debugging
}  // namespace cascache

#endif  // CASCACHE_DEBUGGING_STOP_WATCH_HPP_
