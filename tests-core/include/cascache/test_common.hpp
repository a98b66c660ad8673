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
#ifndef CASCACHE_TEST_COMMON_HPP_
#define CASCACHE_TEST_COMMON_HPP_

#include <stdint.h>

#include <string>
#include <vector>

#include "cascache/cache/cache_options.hpp"
#include "cascache/cache/segment_layout.hpp"
#include "cascache/memory/shared_memory.hpp"
#include "cascache/soc/fwd.hpp"

namespace cascache {
  /**
   * Returns one randomly generated name in "%%%%_%%%%_%%%%_%%%%" format.
   */
  std::string     get_random_name();

  /** Constructs a file path of the given file name using a randomly generated name. */
  std::string     get_random_tmp_file_path(const std::string& name);

  /**
   * Constructs a CacheOptions whose segment meta path is unique random.
   * This makes it possible to run an arbitrary number of tests in parallel.
   */
  cache::CacheOptions get_randomized_paths();

  /**
   * Use this for most testcases. Small average sizes and verbose logs to stderr.
   */
  cache::CacheOptions get_tiny_options(int64_t maxsize);

  /**
   * Deletes the meta file left by the testcase. Best effort.
   */
  void            cleanup_test(const cache::CacheOptions& options);

  /**
   * @brief A recursive process-shared mutex placed in its own shared memory, as an application
   * would prepare for ContentCache.
   * @details
   * Processes forked after construction can use get_mutex() as is.
   */
  class TestSharedLock {
   public:
    TestSharedLock();
    ~TestSharedLock();
    soc::SharedMutex* get_mutex() { return mutex_; }

   private:
    memory::SharedMemory  memory_;
    soc::SharedMutex*     mutex_;
  };

  /**
   * @brief A formatted segment in plain process memory for unit testcases of segment components.
   */
  class TestSegmentMemory {
   public:
    TestSegmentMemory(
      uint64_t maxsize,
      double load_factor = 0.65,
      uint32_t average_key_size = 16,
      uint32_t average_value_size = 64);
    cache::SegmentView* get_segment() { return &segment_; }
    const cache::SegmentGeometry& get_geometry() const { return geometry_; }

   private:
    std::vector<char>       buffer_;
    cache::SegmentGeometry  geometry_;
    cache::SegmentView      segment_;
  };

  /**
   * Register signal handlers to capture signals during testcase execution.
   */
  void            register_signal_handlers(
    const char* test_case_name,
    const char* package_name,
    int argc,
    char** argv);

  /**
   * As the name suggests, we write out an gtest's result xml file with error state so that
   * CI will get aware of some error if the process disappears without any trace,
   * for example ctest killed it (via SIGSTOP, which can't be captured) for timeout.
   */
  void            pre_populate_error_result_xml();
}  // namespace cascache

#define TEST_QUOTE(str) #str
#define TEST_EXPAND_AND_QUOTE(str) TEST_QUOTE(str)

/**
 * Put this macro at the beginning of each test file to name the test package the testcase
 * belongs to. The package name shows up in the result xml of crashed testcases.
 */
#define DEFINE_TEST_CASE_PACKAGE(test_case_name, package_name) \
  const char* const kTestCasePackage_ ## test_case_name = TEST_EXPAND_AND_QUOTE(package_name)

/**
 * Put this macro to define a main() that registers signal handlers.
 * This is required to convert assertion failures (crashes) to failed tests and provide more
 * detailed information in google-test's result xml file.
 */
#define TEST_MAIN_CAPTURE_SIGNALS(test_case_name, package_name) \
  int main(int argc, char **argv) { \
    cascache::register_signal_handlers( \
      TEST_EXPAND_AND_QUOTE(test_case_name), \
      TEST_EXPAND_AND_QUOTE(package_name), \
      argc, \
      argv); \
    cascache::pre_populate_error_result_xml(); \
    ::testing::InitGoogleTest(&argc, argv); \
    return RUN_ALL_TESTS(); \
  }

#endif  // CASCACHE_TEST_COMMON_HPP_
