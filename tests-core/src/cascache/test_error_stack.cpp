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
#include <gtest/gtest.h>

#include <cstring>
#include <sstream>
#include <string>

#include "cascache/error_code.hpp"
#include "cascache/error_stack.hpp"
#include "cascache/test_common.hpp"
#include "cascache/cache/cache_id.hpp"

namespace cascache {

DEFINE_TEST_CASE_PACKAGE(ErrorStackTest, cascache);

ErrorStack raise_timeout() {
  return ERROR_STACK_MSG(kErrorCodeTimeout, "waited 3 sec");
}

ErrorStack propagate_once() {
  CHECK_ERROR(raise_timeout());
  return kRetOk;
}

ErrorStack propagate_with_message() {
  CHECK_ERROR_MSG(raise_timeout(), ", while attaching");
  return kRetOk;
}

ErrorStack recurse(int levels) {
  if (levels == 0) {
    return ERROR_STACK(kErrorCodeInternalError);
  }
  CHECK_ERROR(recurse(levels - 1));
  return kRetOk;
}

ErrorStack wrap_not_found() {
  WRAP_ERROR_CODE(kErrorCodeCacheKeyNotFound);
  return kRetOk;
}

ErrorCode unwrap_timeout() {
  UNWRAP_ERROR_STACK(propagate_once());
  return kErrorCodeOk;
}

TEST(ErrorStackTest, Ok) {
  ErrorStack ok;
  EXPECT_FALSE(ok.is_error());
  EXPECT_EQ(kErrorCodeOk, ok.get_error_code());
  EXPECT_EQ(0, ok.get_stack_depth());
  EXPECT_TRUE(ok.get_custom_message() == nullptr);
  std::stringstream str;
  str << kRetOk;
  EXPECT_EQ(std::string("No error"), str.str());
}

TEST(ErrorStackTest, Raise) {
  ErrorStack error = raise_timeout();
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(kErrorCodeTimeout, error.get_error_code());
  EXPECT_EQ(1, error.get_stack_depth());
  EXPECT_EQ(std::string("waited 3 sec"), error.get_custom_message());
  EXPECT_TRUE(std::strstr(error.get_frame(0).file_, "test_error_stack") != nullptr);
  EXPECT_EQ(std::string("raise_timeout"), error.get_frame(0).func_);
  EXPECT_GT(error.get_frame(0).line_, 0U);
}

TEST(ErrorStackTest, Propagate) {
  ErrorStack error = propagate_once();
  EXPECT_EQ(kErrorCodeTimeout, error.get_error_code());
  ASSERT_EQ(2, error.get_stack_depth());
  EXPECT_EQ(std::string("raise_timeout"), error.get_frame(0).func_);
  EXPECT_EQ(std::string("propagate_once"), error.get_frame(1).func_);

  ErrorStack error2 = propagate_with_message();
  EXPECT_EQ(kErrorCodeTimeout, error2.get_error_code());
  EXPECT_EQ(std::string("waited 3 sec, while attaching"), error2.get_custom_message());

  std::stringstream str;
  str << error2;
  EXPECT_NE(std::string::npos, str.str().find("kErrorCodeTimeout"));
  EXPECT_NE(std::string::npos, str.str().find("propagate_with_message()"));
}

TEST(ErrorStackTest, MaxDepth) {
  ErrorStack error = recurse(ErrorStack::kMaxStackDepth * 2);
  EXPECT_EQ(kErrorCodeInternalError, error.get_error_code());
  EXPECT_EQ(ErrorStack::kMaxStackDepth, error.get_stack_depth());
  std::stringstream str;
  str << error;
  EXPECT_NE(std::string::npos, str.str().find("more frames"));
}

TEST(ErrorStackTest, WrapUnwrap) {
  ErrorStack error = wrap_not_found();
  EXPECT_EQ(kErrorCodeCacheKeyNotFound, error.get_error_code());
  EXPECT_EQ(1, error.get_stack_depth());
  EXPECT_EQ(kErrorCodeTimeout, unwrap_timeout());
}

TEST(ErrorStackTest, CopySteals) {
  ErrorStack original = raise_timeout();
  ErrorStack copied(original);
  EXPECT_EQ(kErrorCodeTimeout, original.get_error_code());
  EXPECT_TRUE(original.get_custom_message() == nullptr);
  EXPECT_EQ(kErrorCodeTimeout, copied.get_error_code());
  EXPECT_EQ(std::string("waited 3 sec"), copied.get_custom_message());

  copied = kRetOk;
  EXPECT_FALSE(copied.is_error());
  EXPECT_TRUE(copied.get_custom_message() == nullptr);
}

TEST(ErrorStackTest, ErrorGroups) {
  EXPECT_EQ(kErrorGroupGeneral, get_error_group(kErrorCodeTimeout));
  EXPECT_EQ(kErrorGroupConf, get_error_group(kErrorCodeConfParseFailed));
  EXPECT_EQ(kErrorGroupSoc, get_error_group(kErrorCodeSocShmAttachFailed));
  EXPECT_EQ(kErrorGroupCacheSetup, get_error_group(kErrorCodeCacheVersionMismatch));
  EXPECT_EQ(kErrorGroupCacheOperation, get_error_group(kErrorCodeCachePoolFull));
  EXPECT_TRUE(cache::is_configuration_error(kErrorCodeCacheInvalidMagic));
  EXPECT_FALSE(cache::is_configuration_error(kErrorCodeCacheKeyNotFound));
  EXPECT_FALSE(cache::is_configuration_error(kErrorCodeConfParseFailed));
  EXPECT_EQ(std::string("kErrorCodeCachePoolFull"), get_error_name(kErrorCodeCachePoolFull));
  EXPECT_EQ(std::string("Key not found"), get_error_message(kErrorCodeCacheKeyNotFound));
}

}  // namespace cascache

TEST_MAIN_CAPTURE_SIGNALS(ErrorStackTest, cascache);
