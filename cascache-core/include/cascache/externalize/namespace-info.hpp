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
#ifndef CASCACHE_EXTERNALIZE_NAMESPACE_INFO_HPP_
#define CASCACHE_EXTERNALIZE_NAMESPACE_INFO_HPP_

/**
 * @namespace cascache::externalize
 * @brief Object Externalization
 * @details
 * @par Overview
 * Analogous to java.io.Externalizable.
 * We externalize cascache::cache::CacheOptions and its children as XML files, so that all
 * processes sharing a segment can load the same configuration.
 *
 * @par Why XML
 * tinyxml2 is tiny, has no dependency, and can store comments. Every option is saved
 * with a comment that explains it, so a saved file doubles as documentation.
 */

/**
 * @defgroup EXTERNALIZE Object Externalization
 * @ingroup IDIOMS
 * @copydoc cascache::externalize
 */

#endif  // CASCACHE_EXTERNALIZE_NAMESPACE_INFO_HPP_
