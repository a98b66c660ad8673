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
#ifndef CASCACHE_ERROR_CODE_HPP_
#define CASCACHE_ERROR_CODE_HPP_

#include <stdint.h>

#include "cascache/compiler.hpp"

namespace cascache {

/**
 * @defgroup ERRORCODES Error codes, messages, and stacktraces
 * @ingroup IDIOMS
 * @brief Error codes (cascache::ErrorCode) and stacktrace information (ErrorStack).
 * @details
 * @par Where codes are defined
 * Every code is one line of error_code.xmacro: enum name, number and message.
 * The line is expanded several times below with different definitions of X, so the enum,
 * get_error_name() and get_error_message() never go out of sync.
 * @see http://en.wikipedia.org/wiki/X_Macro
 *
 * @par ErrorCode vs ErrorStack
 * Cache operations (get/set/remove..) return a bare ErrorCode. They run under the cache lock
 * thousands of times per second, and a missing key is an ordinary outcome for them.
 * Rare operations that are worth a stacktrace (attaching a segment, loading options,
 * verifying the tables) return ErrorStack instead.
 * @code{.cpp}
 * ErrorStack warm_up(ContentCache* cache) {
 *   WRAP_ERROR_CODE(cache->set("key", "value"));
 *   CHECK_ERROR(cache->verify());
 *   return kRetOk;
 * }
 * @endcode
 */

#define X(a, b, c) /** b: c. */ a = b,
/**
 * @var ErrorCode
 * @ingroup ERRORCODES
 * @brief Enum of error codes defined in error_code.xmacro.
 */
enum ErrorCode {
  /** 0 means no-error. */
  kErrorCodeOk = 0,
#include "cascache/error_code.xmacro" // NOLINT
};
#undef X

/**
 * @brief The upper byte of an error code, which tells what raised it.
 * @ingroup ERRORCODES
 */
enum ErrorGroup {
  kErrorGroupGeneral = 0x00,
  kErrorGroupConf = 0x01,
  kErrorGroupSoc = 0x02,
  /** The cache can't be opened with the given options or segment. Never recovered by retry. */
  kErrorGroupCacheSetup = 0x03,
  /** Raised by an individual cache operation. */
  kErrorGroupCacheOperation = 0x04,
};

inline ErrorGroup get_error_group(ErrorCode code) {
  return static_cast<ErrorGroup>((static_cast<uint32_t>(code) >> 8) & 0xFFU);
}

// A bit tricky to get "a" from a in C macro.
#define X_QUOTE(str) #str
#define X_EXPAND_AND_QUOTE(str) X_QUOTE(str)
#define X(a, b, c) case a: return X_EXPAND_AND_QUOTE(a);
/**
 * @brief Returns the enum name of the code, such as "kErrorCodeCacheKeyNotFound".
 * @ingroup ERRORCODES
 */
inline const char* get_error_name(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "kErrorCodeOk";
#include "cascache/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
#undef X_EXPAND_AND_QUOTE
#undef X_QUOTE

#define X(a, b, c) case a: return c;
/**
 * @brief Returns the human-readable message of the code.
 * @ingroup ERRORCODES
 */
inline const char* get_error_message(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "no_error";
#include "cascache/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
}  // namespace cascache

/**
 * @def CHECK_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief Evaluates \b x and returns its ErrorCode from the current function unless it is
 * kErrorCodeOk.
 * @details
 * For functions that return ErrorCode. Use WRAP_ERROR_CODE() in functions that return ErrorStack.
 */
#define CHECK_ERROR_CODE(x)\
{\
  cascache::ErrorCode __e = x;\
  if (UNLIKELY(__e != cascache::kErrorCodeOk)) {\
    return __e;\
  }\
}

#endif  // CASCACHE_ERROR_CODE_HPP_
