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
#ifndef CASCACHE_EXTERNALIZE_EXTERNALIZABLE_HPP_
#define CASCACHE_EXTERNALIZE_EXTERNALIZABLE_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>

#include "cascache/cxx11.hpp"
#include "cascache/error_stack.hpp"
#include "cascache/fs/path.hpp"

// forward declarations for tinyxml2. They should provide a header file for this...
namespace tinyxml2 {
  class XMLDocument;
  class XMLElement;
}  // namespace tinyxml2

namespace cascache {
namespace externalize {
/**
 * @brief An options object that is kept in an XML file.
 * @ingroup EXTERNALIZE
 * @details
 * Each member variable is one child element whose tag is the variable name, so a file
 * written by save_to_file() can be edited by hand and read back with load_from_file().
 * Derived classes declare EXTERNALIZABLE() and implement load()/save() with the
 * EXTERNALIZE_xxx macros.
 *
 * Only the value types our options use are supported:
 * bool, int16_t, uint16_t, uint32_t, int64_t, uint64_t, double, std::string and enums.
 */
struct Externalizable {
  virtual ~Externalizable() {}

  /**
   * @brief Reads the content of this object from the given XML element.
   * @details
   * Expect errors due to missing-elements, out-of-range values, etc.
   */
  virtual ErrorStack load(tinyxml2::XMLElement* element) = 0;

  /** Writes the content of this object as children of the given XML element. */
  virtual ErrorStack save(tinyxml2::XMLElement* element) const = 0;

  /** Tag of the root element when this object is the whole document. */
  virtual const char* get_tag_name() const = 0;

  /** Writes this object as an XML document to the stream. Errors are written inline. */
  void        save_to_stream(std::ostream* ptr) const;

  /** Loads this object from an XML file. */
  ErrorStack  load_from_file(const fs::Path &path);

  /** Loads this object from an XML text, usually for testing. */
  ErrorStack  load_from_string(const std::string& xml);

  /**
   * @brief Atomically and durably writes out this object to the specified XML file.
   * @details
   * Writes to a temporary file in the same folder, then renames it over the destination.
   * The parent folder is created if it doesn't exist.
   */
  ErrorStack  save_to_file(const fs::Path &path) const;

 protected:
  /** Puts an XML comment right before the element. */
  static ErrorStack insert_comment(tinyxml2::XMLElement* element, const std::string& comment);

  /** Explicitly instantiated in cpp for each supported type. */
  template <typename T>
  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, T value);

  template <typename ENUM>
  static ErrorStack add_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, ENUM value) {
    return add_element(parent, tag, comment, static_cast<int64_t>(value));
  }

  static ErrorStack add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const Externalizable& child);

  /**
   * Explicitly instantiated in cpp for each supported type.
   * If \b optional and the element doesn't exist, \b out receives \b default_value.
   */
  template <typename T>
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  T* out, bool optional = false, T default_value = T());
  /** string type is bit special. */
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  std::string* out, bool optional = false, const char* default_value = "");

  template <typename ENUM>
  static ErrorStack get_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
          ENUM* out, bool optional = false, ENUM default_value = static_cast<ENUM>(0)) {
    // enum might be signed or unsigned, but surely it won't exceed int64_t range.
    int64_t tmp;
    CHECK_ERROR(get_element<int64_t>(parent, tag, &tmp, optional, default_value));
    if (static_cast<int64_t>(static_cast<ENUM>(tmp)) != tmp) {
      return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, tag.c_str());
    }
    *out = static_cast<ENUM>(tmp);
    return kRetOk;
  }

  /** A missing optional child leaves \b child as it is. */
  static ErrorStack get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
            Externalizable* child, bool optional = false);

 private:
  /** Loads this object from the root of a document that tinyxml2 tried to parse. */
  ErrorStack  load_document(
    tinyxml2::XMLDocument* document,
    int parse_result,
    const std::string& source);
  /** Makes this object the root of the empty document. */
  ErrorStack  build_document(tinyxml2::XMLDocument* document) const;
};

}  // namespace externalize
}  // namespace cascache

// A bit tricky to get "a" from a in C macro.
#define EX_QUOTE(str) #str
#define EX_EXPAND(str) EX_QUOTE(str)

/**
 * @def EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment)
 * @ingroup EXTERNALIZE
 * @brief Adds an xml element for a member variable of \e this object.
 * The variable name is the tag name and \b comment goes before it.
 */
#define EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_element(element, EX_EXPAND(attribute), comment, attribute))
/** @copydoc EXTERNALIZE_SAVE_ELEMENT For enums, use this one. */
#define EXTERNALIZE_SAVE_ENUM_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_enum_element(element, EX_EXPAND(attribute), comment, attribute))

/**
 * @def EXTERNALIZE_LOAD_ELEMENT(element, attribute)
 * @ingroup EXTERNALIZE
 * @brief Reads the required child element named after a member variable of \e this object.
 */
#define EXTERNALIZE_LOAD_ELEMENT(element, attribute) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute))
/** For optional elements. default_value is set if the element doesn't exist. */
#define EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, attribute, default_value) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute, true, default_value))
/** For enums. */
#define EXTERNALIZE_LOAD_ENUM_ELEMENT(element, attribute) \
  CHECK_ERROR(get_enum_element(element, EX_EXPAND(attribute), & attribute))
/** For optional enums. */
#define EXTERNALIZE_LOAD_ENUM_ELEMENT_OPTIONAL(element, attribute, default_value) \
  CHECK_ERROR(get_enum_element(element, EX_EXPAND(attribute), & attribute, true, default_value))

/**
 * @def EXTERNALIZABLE(clazz)
 * @ingroup EXTERNALIZE
 * @brief Declares load()/save() and defines the tag name and operator<< of the class.
 * @details
 * Invoke it in public scope of the class definition, then define load() and save() in cpp.
 */
#define EXTERNALIZABLE(clazz) \
  ErrorStack load(tinyxml2::XMLElement* element) CXX11_OVERRIDE;\
  ErrorStack save(tinyxml2::XMLElement* element) const CXX11_OVERRIDE;\
  const char* get_tag_name() const CXX11_OVERRIDE { return EX_EXPAND(clazz); }\
  friend std::ostream& operator<<(std::ostream& o, const clazz & v) {\
    v.save_to_stream(&o);\
    return o;\
  }

#endif  // CASCACHE_EXTERNALIZE_EXTERNALIZABLE_HPP_
