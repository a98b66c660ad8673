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
#ifndef CASCACHE_COMPILER_HPP_
#define CASCACHE_COMPILER_HPP_

/**
 * @defgroup COMPILER Compiler Specific Optimizations
 * @ingroup IDIOMS
 * @brief Branch hints and alignment assumptions, analogous to linux/compiler.h.
 * @details
 * The error macros hint that errors are rare. The segment accessors tell the compiler that
 * table entries are 8-aligned, which every entry offset guarantees.
 */

/**
 * @def LIKELY(x)
 * @ingroup COMPILER
 * @brief Hints that x is highly likely true. GCC's __builtin_expect.
 */
/**
 * @def UNLIKELY(x)
 * @ingroup COMPILER
 * @brief Hints that x is highly likely false. GCC's __builtin_expect.
 */
/**
 * @def ASSUME_ALIGNED(x, y)
 * @ingroup COMPILER
 * @brief Pointer \b x is aligned to \b y bytes. GCC's __builtin_assume_aligned.
 */
#if defined(__GNUC__) || defined(__clang__)
#define LIKELY(x)      __builtin_expect(!!(x), 1)
#define UNLIKELY(x)    __builtin_expect(!!(x), 0)
#define ASSUME_ALIGNED(x, y) __builtin_assume_aligned(x, y)
#else  // defined(__GNUC__) || defined(__clang__)
#define LIKELY(x)      (x)
#define UNLIKELY(x)    (x)
#define ASSUME_ALIGNED(x, y) x
#endif  // defined(__GNUC__) || defined(__clang__)

#endif  // CASCACHE_COMPILER_HPP_
