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
#ifndef CASCACHE_ERROR_STACK_HPP_
#define CASCACHE_ERROR_STACK_HPP_

#include <errno.h>
#include <stdint.h>

#include <cstring>
#include <iosfwd>

#include "cascache/assert_nd.hpp"
#include "cascache/compiler.hpp"
#include "cascache/cxx11.hpp"
#include "cascache/error_code.hpp"

namespace cascache {

/**
 * @brief An ErrorCode plus the places it went through, returned by rarely-called functions.
 * @ingroup ERRORCODES
 * @details
 * Opening and verifying a segment, loading options and other setup paths return this.
 * Each CHECK_ERROR() on the way up adds the file, function and line to the trace,
 * so the log tells exactly which step of initialization failed.
 *
 * @par No exceptions
 * libcascache never throws. The cache is linked into processes we know nothing about, and an
 * exception leaving a critical section would depend on the caller to release the segment lock.
 *
 * @par Cost
 * Frames are const pointers to permanent strings (__FILE__, __FUNCTION__), so the only heap
 * allocation is the optional custom message. The no-error object is as cheap as a few stores.
 *
 * @par Copy means move
 * Copying steals the custom message and the "unchecked" flag from the source,
 * so only the last copy complains (in DEBUG) if nobody looked at the error.
 */
class ErrorStack {
 public:
  /** Frames beyond this depth are silently dropped. */
  enum Constants {
     kMaxStackDepth = 8,
  };

  /** One place the error went through. */
  struct Frame {
    const char* file_;
    const char* func_;
    uint32_t    line_;
  };

  /** Same as kRetOk. */
  ErrorStack()
    : custom_message_(CXX11_NULLPTR), os_errno_(0), error_code_(kErrorCodeOk),
      stack_depth_(0), checked_(true) {}

  /** An error without frames. The current errno is remembered. */
  explicit ErrorStack(ErrorCode code)
    : custom_message_(CXX11_NULLPTR), os_errno_(errno), error_code_(code),
      stack_depth_(0), checked_(false) {}

  /**
   * @brief An error raised at the given place, usually via ERROR_STACK() or ERROR_STACK_MSG().
   * @param[in] file permanent string, usually __FILE__
   * @param[in] func permanent string, usually __FUNCTION__
   * @param[in] line usually __LINE__
   * @param[in] code must be an error
   * @param[in] custom_message deep-copied if non-NULL
   */
  ErrorStack(const char* file, const char* func, uint32_t line, ErrorCode code,
        const char* custom_message = CXX11_NULLPTR);

  ErrorStack(const ErrorStack &other) : custom_message_(CXX11_NULLPTR) { operator=(other); }

  /** Takes over \b other and adds the given place as the outermost frame. */
  ErrorStack(const ErrorStack &other, const char* file, const char* func, uint32_t line,
        const char* more_custom_message = CXX11_NULLPTR);

  ErrorStack& operator=(const ErrorStack &other);

  ~ErrorStack() {
    if (UNLIKELY(error_code_ != kErrorCodeOk)) {
#ifdef DEBUG
      verify();
#endif  // DEBUG
      delete[] custom_message_;
    }
  }

  bool        is_error() const {
    checked_ = true;
    return error_code_ != kErrorCodeOk;
  }
  ErrorCode   get_error_code() const {
    checked_ = true;
    return error_code_;
  }
  const char* get_message() const { return get_error_message(error_code_); }
  /** Null if there is no custom message or no error. */
  const char* get_custom_message() const {
    return error_code_ == kErrorCodeOk ? CXX11_NULLPTR : custom_message_;
  }
  /** errno at the time the error was raised. Might be unrelated to the error. */
  int         get_os_errno() const { return error_code_ == kErrorCodeOk ? 0 : os_errno_; }

  uint16_t    get_stack_depth() const {
    return error_code_ == kErrorCodeOk ? 0 : stack_depth_;
  }
  /** 0 is where the error was raised. */
  const Frame& get_frame(uint16_t stack_index) const {
    ASSERT_ND(stack_index < get_stack_depth());
    return frames_[stack_index];
  }

  /** Appends more text to the custom message. */
  void        append_custom_message(const char* more_custom_message);

  /** Aborts if this is an error nobody has checked. */
  void        verify() const {
    if (UNLIKELY(error_code_ != kErrorCodeOk && !checked_)) {
      dump_and_abort("Return value is not checked. ErrorStack must be checked");
    }
  }

  void        output(std::ostream* ptr) const;

  /** Logs this object with a backtrace as FATAL, which aborts. */
  void        dump_and_abort(const char *abort_message) const;

  friend std::ostream& operator<<(std::ostream& o, const ErrorStack& obj);

 private:
  void        push_frame(const char* file, const char* func, uint32_t line);
  void        set_custom_message(const char* message);

  Frame               frames_[kMaxStackDepth];
  /** new[]-ed. Moves with the object. */
  mutable const char* custom_message_;
  int                 os_errno_;
  /** If this is kErrorCodeOk, other members have no meanings. */
  ErrorCode           error_code_;
  uint16_t            stack_depth_;
  mutable bool        checked_;
};

/**
 * @var kRetOk
 * @ingroup ERRORCODES
 * @brief Normal return value for no-error case.
 */
const ErrorStack kRetOk;

inline void ErrorStack::push_frame(const char* file, const char* func, uint32_t line) {
  if (stack_depth_ < kMaxStackDepth) {
    frames_[stack_depth_].file_ = file;
    frames_[stack_depth_].func_ = func;
    frames_[stack_depth_].line_ = line;
    ++stack_depth_;
  }
}

inline void ErrorStack::set_custom_message(const char* message) {
  delete[] custom_message_;
  custom_message_ = CXX11_NULLPTR;
  if (message) {
    // do NOT use strdup to make sure new/delete everywhere.
    size_t len = std::strlen(message);
    char *copied = new char[len + 1];
    std::memcpy(copied, message, len + 1);
    custom_message_ = copied;
  }
}

inline ErrorStack::ErrorStack(const char* file, const char* func, uint32_t line,
                ErrorCode code, const char* custom_message)
  : custom_message_(CXX11_NULLPTR), os_errno_(errno), error_code_(code), stack_depth_(0),
    checked_(false) {
  ASSERT_ND(code != kErrorCodeOk);
  push_frame(file, func, line);
  set_custom_message(custom_message);
}

inline ErrorStack::ErrorStack(const ErrorStack &other, const char* file,
              const char* func, uint32_t line, const char* more_custom_message)
  : custom_message_(CXX11_NULLPTR) {
  operator=(other);
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
  // errors built from a bare ErrorCode have no frames to extend
  if (stack_depth_ > 0) {
    push_frame(file, func, line);
  }
  if (more_custom_message) {
    append_custom_message(more_custom_message);
  }
}

inline ErrorStack& ErrorStack::operator=(const ErrorStack &other) {
  if (this == &other) {
    return *this;
  }
  delete[] custom_message_;
  custom_message_ = CXX11_NULLPTR;
  error_code_ = other.error_code_;
  if (LIKELY(other.error_code_ == kErrorCodeOk)) {
    return *this;
  }
  custom_message_ = other.custom_message_;
  other.custom_message_ = CXX11_NULLPTR;
  stack_depth_ = other.stack_depth_;
  std::memcpy(frames_, other.frames_, sizeof(Frame) * other.stack_depth_);
  os_errno_ = other.os_errno_;
  checked_ = false;
  other.checked_ = true;
  return *this;
}

inline void ErrorStack::append_custom_message(const char* more_custom_message) {
  if (error_code_ == kErrorCodeOk || more_custom_message == CXX11_NULLPTR) {
    return;
  }
  if (!custom_message_) {
    set_custom_message(more_custom_message);
    return;
  }
  size_t cur_len = std::strlen(custom_message_);
  size_t more_len = std::strlen(more_custom_message);
  char *concatenated = new char[cur_len + more_len + 1];
  std::memcpy(concatenated, custom_message_, cur_len);
  std::memcpy(concatenated + cur_len, more_custom_message, more_len + 1);
  delete[] custom_message_;
  custom_message_ = concatenated;
}

}  // namespace cascache

// The followings are macros. So, they belong to no namespaces.

/**
 * @def ERROR_STACK(e)
 * @ingroup ERRORCODES
 * @brief Raises the given cascache::ErrorCode here, with the current place as the first frame.
 */
#define ERROR_STACK(e)      cascache::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e)

/**
 * @def ERROR_STACK_MSG(e, m)
 * @ingroup ERRORCODES
 * @brief ERROR_STACK(e) with a custom message.
 */
#define ERROR_STACK_MSG(e, m)   cascache::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e, m)

/**
 * @def CHECK_ERROR(x)
 * @ingroup ERRORCODES
 * @brief Evaluates \b x (an ErrorStack) and returns it from the current function with one more
 * frame if it is an error.
 * @note The name is CHECK_ERROR, not CHECK, because Google-logging defines CHECK.
 */
#define CHECK_ERROR(x)\
{\
  cascache::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return cascache::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__);\
  }\
}

/**
 * @def CHECK_ERROR_MSG(x, m)
 * @ingroup ERRORCODES
 * @brief CHECK_ERROR(x) that also appends \b m to the custom message.
 */
#define CHECK_ERROR_MSG(x, m)\
{\
  cascache::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return cascache::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__, m);\
  }\
}

/**
 * @def WRAP_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief Evaluates \b x (an ErrorCode) and raises it as ErrorStack if it is an error.
 * @note Unlike CHECK_ERROR_CODE(x), this returns ErrorStack.
 */
#define WRAP_ERROR_CODE(x)\
{\
  cascache::ErrorCode __e = x;\
  if (UNLIKELY(__e != cascache::kErrorCodeOk)) {return ERROR_STACK(__e);}\
}

/**
 * @def UNWRAP_ERROR_STACK(x)
 * @ingroup ERRORCODES
 * @brief The opposite of WRAP_ERROR_CODE(x). Returns only the ErrorCode of the ErrorStack,
 * dropping its frames.
 */
#define UNWRAP_ERROR_STACK(x)\
{\
  cascache::ErrorStack __e = x;\
  if (UNLIKELY(__e.is_error())) { return __e.get_error_code(); }\
}

/**
 * @def CHECK_OUTOFMEMORY(ptr)
 * @ingroup ERRORCODES
 * @brief Raises kErrorCodeOutofmemory if \b ptr is null.
 */
#define CHECK_OUTOFMEMORY(ptr)\
if (UNLIKELY(!ptr)) {\
  return cascache::ErrorStack(__FILE__, __FUNCTION__, __LINE__, cascache::kErrorCodeOutofmemory);\
}

/**
 * @def COERCE_ERROR(x)
 * @ingroup ERRORCODES
 * @brief Evaluates \b x (an ErrorStack) and aborts with the stacktrace if it is an error.
 * @details
 * Only for places where an error is anyway catastrophic, such as destructors and testcases.
 */
#define COERCE_ERROR(x)\
{\
  cascache::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    __e.dump_and_abort("Unexpected error happened");\
  }\
}

/**
 * @def COERCE_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief COERCE_ERROR(x) for an ErrorCode.
 */
#define COERCE_ERROR_CODE(x)\
{\
  cascache::ErrorCode __ec = x;\
  if (UNLIKELY(__ec != cascache::kErrorCodeOk)) {\
    ERROR_STACK(__ec).dump_and_abort("Unexpected error happened");\
  }\
}

#endif  // CASCACHE_ERROR_STACK_HPP_
