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
#include "cascache/externalize/externalizable.hpp"

#include <tinyxml2.h>

#include <fstream>
#include <ostream>
#include <sstream>
#include <string>

#include "cascache/assorted/assorted_func.hpp"
#include "cascache/externalize/tinyxml_wrapper.hpp"
#include "cascache/fs/filesystem.hpp"
#include "cascache/fs/path.hpp"

namespace cascache {
namespace externalize {

namespace {
/** Writes the printed document to a temporary file beside \b path, then renames it. */
ErrorStack write_durably(const fs::Path& path, const tinyxml2::XMLPrinter& printer) {
  fs::Path folder = path.parent_path();
  if (!folder.empty() && !fs::exists(folder) && !fs::create_directories(folder, true)) {
    std::stringstream custom_message;
    custom_message << "file=" << path << ", folder=" << folder
      << ", err=" << assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeConfMkdirsFailed, custom_message.str().c_str());
  }

  fs::Path tmp_path(path);
  tmp_path += ".tmp_";
  tmp_path += fs::unique_name("%%%%%%%%");
  std::ofstream out(tmp_path.c_str(), std::ios::out | std::ios::trunc);
  // CStrSize() counts the null terminator
  out.write(printer.CStr(), printer.CStrSize() - 1);
  out.close();
  if (!out) {
    fs::remove(tmp_path);
    return ERROR_STACK_MSG(kErrorCodeConfCouldNotWrite, tmp_path.c_str());
  }

  if (!fs::durable_atomic_rename(tmp_path, path)) {
    std::stringstream custom_message;
    custom_message << "dest file=" << path << ", src file=" << tmp_path
      << ", err=" << assorted::os_error();
    fs::remove(tmp_path);
    return ERROR_STACK_MSG(kErrorCodeConfCouldNotRename, custom_message.str().c_str());
  }
  return kRetOk;
}
}  // namespace

ErrorStack Externalizable::load_document(
  tinyxml2::XMLDocument* document,
  int parse_result,
  const std::string& source) {
  if (parse_result != tinyxml2::XML_SUCCESS) {
    std::stringstream custom_message;
    custom_message << source << ", tinyxml2 error=" << parse_result;
    return ERROR_STACK_MSG(kErrorCodeConfParseFailed, custom_message.str().c_str());
  }
  if (!document->RootElement()) {
    return ERROR_STACK_MSG(kErrorCodeConfEmptyXml, source.c_str());
  }
  return load(document->RootElement());
}

ErrorStack Externalizable::build_document(tinyxml2::XMLDocument* document) const {
  tinyxml2::XMLElement* root = document->NewElement(get_tag_name());
  CHECK_OUTOFMEMORY(root);
  document->InsertFirstChild(root);
  return save(root);
}

ErrorStack Externalizable::load_from_string(const std::string& xml) {
  tinyxml2::XMLDocument document;
  int result = document.Parse(xml.data(), xml.size());
  return load_document(&document, result, "xml=" + xml);
}

ErrorStack Externalizable::load_from_file(const fs::Path& path) {
  if (!fs::exists(path)) {
    return ERROR_STACK_MSG(kErrorCodeConfFileNotFound, path.c_str());
  }
  tinyxml2::XMLDocument document;
  int result = document.LoadFile(path.c_str());
  return load_document(&document, result, "file=" + path.string());
}

void Externalizable::save_to_stream(std::ostream* ptr) const {
  std::ostream &o = *ptr;
  tinyxml2::XMLDocument document;
  ErrorStack error_stack = build_document(&document);
  if (error_stack.is_error()) {
    o << "Failed to write " << get_tag_name() << " as XML: " << error_stack;
    return;
  }
  tinyxml2::XMLPrinter printer;
  document.Print(&printer);
  o << printer.CStr();
}

ErrorStack Externalizable::save_to_file(const fs::Path& path) const {
  tinyxml2::XMLDocument document;
  CHECK_ERROR(build_document(&document));
  tinyxml2::XMLPrinter printer;
  document.Print(&printer);
  return write_durably(path, printer);
}

ErrorStack Externalizable::insert_comment(
  tinyxml2::XMLElement* element,
  const std::string& comment) {
  if (comment.empty()) {
    return kRetOk;
  }
  tinyxml2::XMLComment* cm = element->GetDocument()->NewComment(comment.c_str());
  CHECK_OUTOFMEMORY(cm);
  tinyxml2::XMLNode* parent = element->Parent();
  tinyxml2::XMLNode* previous = element->PreviousSibling();
  if (!parent) {
    element->GetDocument()->InsertFirstChild(cm);
  } else if (previous) {
    parent->InsertAfterChild(previous, cm);
  } else {
    parent->InsertFirstChild(cm);
  }
  return kRetOk;
}

template <typename T>
ErrorStack Externalizable::add_element(
  tinyxml2::XMLElement* parent,
  const std::string& tag,
  const std::string& comment,
  T value) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  CHECK_OUTOFMEMORY(element);
  TinyxmlSetter<T>()(element, value);
  parent->InsertEndChild(element);
  if (!comment.empty()) {
    CHECK_ERROR(insert_comment(element,
      tag + " (type=" + assorted::get_pretty_type_name<T>() + "): " + comment));
  }
  return kRetOk;
}

ErrorStack Externalizable::add_child_element(
  tinyxml2::XMLElement* parent,
  const std::string& tag,
  const Externalizable& child) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  CHECK_OUTOFMEMORY(element);
  parent->InsertEndChild(element);
  return child.save(element);
}

template <typename T>
ErrorStack Externalizable::get_element(
  tinyxml2::XMLElement* parent,
  const std::string& tag,
  T* out,
  bool optional,
  T default_value) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (!element) {
    if (!optional) {
      return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
    }
    *out = default_value;
    return kRetOk;
  }
  if (TinyxmlGetter<T>()(element, out) != tinyxml2::XML_SUCCESS) {
    return ERROR_STACK_MSG(kErrorCodeConfInvalidElement, tag.c_str());
  }
  return kRetOk;
}

ErrorStack Externalizable::get_element(
  tinyxml2::XMLElement* parent,
  const std::string& tag,
  std::string* out,
  bool optional,
  const char* default_value) {
  return get_element<std::string>(parent, tag, out, optional, std::string(default_value));
}

ErrorStack Externalizable::get_child_element(
  tinyxml2::XMLElement* parent,
  const std::string& tag,
  Externalizable* child,
  bool optional) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element) {
    return child->load(element);
  } else if (optional) {
    return kRetOk;
  }
  return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
}

// @cond DOXYGEN_IGNORE
#define EXPLICIT_INSTANTIATION(x) \
  template ErrorStack Externalizable::add_element< x >(\
    tinyxml2::XMLElement* parent, const std::string& tag, const std::string& comment, x value);\
  template ErrorStack Externalizable::get_element< x >(\
    tinyxml2::XMLElement* parent, const std::string& tag, x * out, bool optional, x default_value)
EXPLICIT_INSTANTIATION(bool);
EXPLICIT_INSTANTIATION(int16_t);
EXPLICIT_INSTANTIATION(uint16_t);
EXPLICIT_INSTANTIATION(uint32_t);
EXPLICIT_INSTANTIATION(int64_t);
EXPLICIT_INSTANTIATION(uint64_t);
EXPLICIT_INSTANTIATION(double);
EXPLICIT_INSTANTIATION(std::string);
#undef EXPLICIT_INSTANTIATION
// @endcond

}  // namespace externalize
}  // namespace cascache
