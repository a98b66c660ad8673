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
#include "cascache/test_common.hpp"

#include <signal.h>
#include <stdint.h>
#include <tinyxml2.h>
#include <unistd.h>

#include <cstring>
#include <fstream>
#include <functional>
#include <iostream>
#include <new>
#include <sstream>
#include <string>

#include "cascache/assert_nd.hpp"
#include "cascache/error_stack.hpp"
#include "cascache/assorted/assorted_func.hpp"
#include "cascache/fs/filesystem.hpp"
#include "cascache/fs/path.hpp"
#include "cascache/soc/shared_mutex.hpp"

namespace cascache {
  std::string get_random_name() {
    // to further randomize the name, we use hash of executable's path and its parameter.
    // we run many concurrent testcases, but all of them have different executable or parameters.

    std::string seed;
    std::ifstream in;
    in.open("/proc/self/cmdline", std::ios_base::in);
    if (!in.is_open()) {
      // there are cases where /proc/self/cmdline doesn't work. in that case just executable path
      seed = assorted::get_current_executable_path();
    } else {
      std::getline(in, seed);
      in.close();
    }

    std::hash<std::string> h1;
    uint64_t differentiator = h1(seed) ^ static_cast<uint64_t>(::getpid());
    return fs::unique_name("%%%%_%%%%_%%%%_%%%%", differentiator);
  }

  std::string get_random_tmp_file_path(const std::string& name) {
    std::string path("/tmp/cascache_test_");
    path += get_random_name();
    path += "_";
    path += name;
    return path;
  }

  cache::CacheOptions get_randomized_paths() {
    cache::CacheOptions options;
    options.segment_meta_path_ = get_random_tmp_file_path("segment");
    std::cout << "test segment=" << options.segment_meta_path_ << std::endl;
    return options;
  }

  cache::CacheOptions get_tiny_options(int64_t maxsize) {
    cache::CacheOptions options = get_randomized_paths();
    options.maxsize_ = maxsize;
    options.average_key_size_bytes_ = 16;
    options.average_value_size_bytes_ = 64;
    options.lock_timeout_seconds_ = 5.0;
    options.eviction_random_seed_ = 12345;
    options.open_mode_ = cache::CacheOptions::kCreateNew;
    options.debugging_.debug_log_to_stderr_ = true;
    options.debugging_.debug_log_min_threshold_ = debugging::DebuggingOptions::kDebugLogInfo;
    options.debugging_.debug_log_stderr_threshold_
      = debugging::DebuggingOptions::kDebugLogInfo;
    options.debugging_.verbose_log_level_ = 1;
    return options;
  }

  void cleanup_test(const cache::CacheOptions& options) {
    fs::Path meta(options.segment_meta_path_);
    if (fs::exists(meta)) {
      fs::remove(meta);
    }
  }

  TestSharedLock::TestSharedLock() : mutex_(nullptr) {
    std::string meta_path = get_random_tmp_file_path("lock");
    COERCE_ERROR(memory_.alloc(meta_path, 1ULL << 12, -1));
    // nobody else attaches by the meta path. children created by fork() inherit the mapping.
    memory_.mark_for_release();
    mutex_ = new (memory_.get_block()) soc::SharedMutex();
    COERCE_ERROR_CODE(mutex_->initialize(true));
  }

  TestSharedLock::~TestSharedLock() {
    if (memory_.is_owned()) {
      mutex_->uninitialize();
    }
    memory_.release_block();
  }

  TestSegmentMemory::TestSegmentMemory(
    uint64_t maxsize,
    double load_factor,
    uint32_t average_key_size,
    uint32_t average_value_size) {
    COERCE_ERROR_CODE(cache::SegmentGeometry::compute(
      maxsize,
      load_factor,
      average_key_size,
      average_value_size,
      &geometry_));
    buffer_.resize(geometry_.total_size_);
    segment_ = cache::SegmentView(&buffer_[0], buffer_.size());
    segment_.format(geometry_);
  }

  namespace {
  /** What the signal handler needs to write a JUnit failure in place of gtest's result. */
  struct TestRunInfo {
    std::string xml_path_;
    std::string individual_test_;
    std::string test_case_name_;
    std::string package_name_;

    std::string qualified_name() const { return package_name_ + "." + test_case_name_; }
  };
  TestRunInfo test_run_info;

  const char* to_signal_name(int sig) {
    switch (sig) {
    case SIGABRT   : return "SIGABRT (abort, such as a failed ASSERT_ND or COERCE_ERROR)";
    case SIGBUS    : return "SIGBUS (bus error, such as touching a detached segment)";
    case SIGFPE    : return "SIGFPE (floating-point exception)";
    case SIGSEGV   : return "SIGSEGV (segmentation violation)";
    default:
      return "UNKNOWN";
    }
  }

  std::string generate_failure_xml(const std::string& type, const std::string& details) {
    const std::string suite_name = test_run_info.qualified_name();
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLElement* root = doc.NewElement("testsuites");
    root->SetAttribute("name", "AllTests");
    root->SetAttribute("tests", 1);
    root->SetAttribute("failures", 1);
    root->SetAttribute("errors", 0);
    root->SetAttribute("time", 0);
    doc.InsertFirstChild(root);

    tinyxml2::XMLElement* suite = doc.NewElement("testsuite");
    suite->SetAttribute("name", suite_name.c_str());
    suite->SetAttribute("tests", 1);
    suite->SetAttribute("failures", 1);
    suite->SetAttribute("errors", 0);
    suite->SetAttribute("disabled", 0);
    suite->SetAttribute("time", 0);
    root->InsertEndChild(suite);

    tinyxml2::XMLElement* testcase = doc.NewElement("testcase");
    testcase->SetAttribute("name", test_run_info.individual_test_.c_str());
    testcase->SetAttribute("status", "run");
    testcase->SetAttribute("classname", suite_name.c_str());
    testcase->SetAttribute("time", 0);
    suite->InsertEndChild(testcase);

    tinyxml2::XMLElement* failure = doc.NewElement("failure");
    failure->SetAttribute("type", type.c_str());
    failure->SetAttribute("message", details.c_str());
    testcase->InsertEndChild(failure);

    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return printer.CStr();
  }

  /** Overwrites gtest's result xml. False if there is none or it can't be written. */
  bool write_result_xml(const std::string& xml) {
    if (test_run_info.xml_path_.empty()) {
      return false;
    }
    std::ofstream out(test_run_info.xml_path_.c_str(), std::ios_base::out | std::ios_base::trunc);
    out << xml;
    out.close();
    return static_cast<bool>(out);
  }

  void handle_signals(int sig, siginfo_t* si, void* /*unused*/) {
    std::stringstream str;
    str << "==== Signal " << sig << " " << to_signal_name(sig) << " at address=" << si->si_addr
      << " while running " << test_run_info.qualified_name() << std::endl
      << get_recent_assert_backtrace()
      << print_backtrace();
    std::string details = str.str();
    std::cerr << details;

    if (write_result_xml(generate_failure_xml(to_signal_name(sig), details))) {
      std::cerr << "Reported the signal as a failure in " << test_run_info.xml_path_ << std::endl;
    } else if (!test_run_info.xml_path_.empty()) {
      std::cerr << "Couldn't write " << test_run_info.xml_path_ << ". os_error="
        << assorted::os_error() << std::endl;
    }
    ::_exit(1);
  }

  const char* const kXmlOutputPrefix = "--gtest_output=xml:";
  const char* const kFilterPrefix = "--gtest_filter=*.";
  }  // namespace

  void register_signal_handlers(
    const char* test_case_name,
    const char* package_name,
    int argc,
    char** argv) {
    test_run_info = TestRunInfo();
    test_run_info.test_case_name_ = test_case_name;
    test_run_info.package_name_ = package_name;
    std::cout << "***** cascache testcase " << test_run_info.qualified_name() << ", argv:";
    for (int i = 0; i < argc; ++i) {
      std::string arg(argv[i]);
      std::cout << " " << arg;
      if (arg.find(kXmlOutputPrefix) == 0) {
        test_run_info.xml_path_ = arg.substr(std::strlen(kXmlOutputPrefix));
      } else if (arg.find(kFilterPrefix) == 0) {
        test_run_info.individual_test_ = arg.substr(std::strlen(kFilterPrefix));
      }
    }
    std::cout << std::endl;
    if (test_run_info.xml_path_.empty()) {
      std::cout << "***** No --gtest_output. Crashes are reported only to stderr" << std::endl;
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_flags = SA_SIGINFO;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_sigaction = handle_signals;
    // only these are considered testcase failures. SIGKILL/SIGSTOP can't be captured.
    ::sigaction(SIGABRT, &sa, nullptr);
    ::sigaction(SIGBUS, &sa, nullptr);
    ::sigaction(SIGFPE, &sa, nullptr);
    ::sigaction(SIGSEGV, &sa, nullptr);
  }

  void pre_populate_error_result_xml() {
    // gtest overwrites this when the process finishes normally.
    write_result_xml(generate_failure_xml(
      "Pre-populated error. Test timeout happened?",
      "The process disappeared without writing its result. ctest might have killed it"
      " for timeout, or someone sent SIGKILL."));
  }
}  // namespace cascache
