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
#ifndef CASCACHE_ASSORTED_NAMESPACE_INFO_HPP_
#define CASCACHE_ASSORTED_NAMESPACE_INFO_HPP_

/**
 * @namespace cascache::assorted
 * @brief Small helpers shared by the cache and its tools.
 * @details
 * Alignment arithmetic for blob records, big-endian conversion of segment integers,
 * hex printing of keys and values, memory fences, and the random generator of eviction.
 * Anything bigger than a few lines deserves its own package.
 */

/**
 * @defgroup ASSORTED Assorted Methods/Classes
 * @ingroup IDIOMS
 * @copydoc cascache::assorted
 */

#endif  // CASCACHE_ASSORTED_NAMESPACE_INFO_HPP_
