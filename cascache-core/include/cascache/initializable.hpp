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
#ifndef CASCACHE_INITIALIZABLE_HPP_
#define CASCACHE_INITIALIZABLE_HPP_

#include "cascache/cxx11.hpp"
#include "cascache/error_stack.hpp"

namespace cascache {
/**
 * @defgroup INITIALIZABLE Initialize/Uninitialize Resources
 * @ingroup IDIOMS
 * @brief Defines a uniform class interface to initialize/uninitialize non-trivial resources.
 * @details
 * Constructors and destructors can't return errors, and we don't use exceptions.
 * So long-living objects that acquire non-trivial resources (a shared memory segment,
 * glog, ..) expose initialize()/uninitialize() returning ErrorStack instead.
 * The constructor only copies parameters; initialize() acquires; uninitialize() releases.
 *
 * Make sure you always explicitly call uninitialize(). C++ can't call virtual functions from
 * destructors, and even if it could, it couldn't propagate the error.
 * UninitializeGuard is an imperfect safety net for early returns.
 * @code{.cpp}
 * ErrorStack your_func() {
 *     ContentCache cache(options, &mutex);
 *     CHECK_ERROR(cache.initialize());
 *     {
 *         UninitializeGuard guard(&cache, UninitializeGuard::kWarnIfUninitializeError);
 *         WRAP_ERROR_CODE(cache.set("key", "value"));
 *         CHECK_ERROR(cache.uninitialize());
 *     }
 *     return kRetOk;
 * }
 * @endcode
 */

/**
 * The pure-virtual interface to initialize/uninitialize non-trivial resources.
 * @ingroup INITIALIZABLE
 */
class Initializable {
 public:
  virtual ~Initializable() {}

  /**
   * @brief Acquires resources in this object, usually called right after constructor.
   * @pre is_initialized() == FALSE
   * @details
   * If and only if the return value was not an error, is_initialized() will return TRUE.
   * This method is responsible for releasing all acquired resources when initialization fails.
   * Not thread-safe.
   */
  virtual ErrorStack  initialize() = 0;

  /** Returns whether the object has been already initialized or not. */
  virtual bool        is_initialized() const = 0;

  /**
   * @brief An \e idempotent method to release all resources of this object, if any.
   * @details
   * After this method, is_initialized() will return FALSE.
   * Whether this method encounters an error or not, the implementation should make the best
   * effort to release as many resources as possible.
   * @attention This method is NOT automatically called from the destructor.
   */
  virtual ErrorStack  uninitialize() = 0;
};

/**
 * @brief Typical implementation of Initializable as a skeleton base class.
 * @ingroup INITIALIZABLE
 * @details
 * Derived classes define initialize_once() and uninitialize_once().
 * Copy construction and copy assignment are disabled.
 */
class DefaultInitializable : public virtual Initializable {
 public:
  DefaultInitializable() : initialized_(false) {}
  virtual ~DefaultInitializable() {}

  DefaultInitializable(const DefaultInitializable&) CXX11_FUNC_DELETE;
  DefaultInitializable& operator=(const DefaultInitializable&) CXX11_FUNC_DELETE;

  /** initialize-once semantics. */
  ErrorStack  initialize() CXX11_OVERRIDE CXX11_FINAL {
    if (is_initialized()) {
      return ERROR_STACK(kErrorCodeAlreadyInitialized);
    }
    ErrorStack init_error = initialize_once();
    if (init_error.is_error()) {
      // if error happes in the middle of initialization, we release resources we acquired.
      CHECK_ERROR(uninitialize_once());
      return init_error;
    }
    initialized_ = true;
    return kRetOk;
  }

  /** uninitialize-once semantics. */
  ErrorStack  uninitialize() CXX11_OVERRIDE CXX11_FINAL {
    if (!is_initialized()) {
      return kRetOk;
    }
    initialized_ = false;
    CHECK_ERROR(uninitialize_once());
    return kRetOk;
  }

  bool        is_initialized() const CXX11_OVERRIDE CXX11_FINAL {
    return initialized_;
  }

  virtual ErrorStack  initialize_once() = 0;
  virtual ErrorStack  uninitialize_once() = 0;

 private:
  bool    initialized_;
};

/**
 * @brief Calls Initializable#uninitialize() automatically when it gets out of scope.
 * @ingroup INITIALIZABLE
 * @details
 * \b NOT \b A \b SILVER \b BULLET! A destructor can't propagate ErrorStack.
 * The only correct solution is to call uninitialize() explicitly and check the result.
 */
class UninitializeGuard {
 public:
  /** Defines the behavior of this scope guard. */
  enum Policy {
    /** Terminates the program if uninitialize() wasn't called when it gets out of scope. */
    kAbortIfNotExplicitlyUninitialized = 0,
    /** Calls uninitialize() if needed, and terminates the program when it fails. Default. */
    kAbortIfUninitializeError,
    /** Calls uninitialize() if needed, and just complains when it fails. */
    kWarnIfUninitializeError,
    /** Calls uninitialize() if needed, and says nothing. NOT RECOMMENDED. */
    kSilent,
  };
  explicit UninitializeGuard(Initializable *target, Policy policy = kAbortIfUninitializeError)
    : target_(target), policy_(policy) {}
  ~UninitializeGuard();

 private:
  Initializable*  target_;
  Policy          policy_;
};

}  // namespace cascache
#endif  // CASCACHE_INITIALIZABLE_HPP_
