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
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <stdint.h>

#include <iostream>
#include <string>

#include "cascache/fs/filesystem.hpp"
#include "cascache/fs/path.hpp"
#include "cascache/util/dump_segment.hpp"

/**
 * @file dump_segment.cpp
 * @brief Segment Dumper Utility for libcascache.
 */
DEFINE_int32(verbose, 0, "Verbosity level of outputs. 0: Shows slots without hashes,"
    " 1: Also shows hashes, fingerprints and the head of contents."
    " 2: Shows tombstones and up to 1kb of each key and content");
DEFINE_int32(limit, 10000, "Maximum number of table slots to show (negative value=no limit).");
DEFINE_bool(dump_keys, false, "Whether to show the key table.");
DEFINE_bool(dump_contents, false, "Whether to show the content table.");

bool ValidateVerbose(const char* flagname, int32_t value) {
    if (value >= static_cast<int32_t>(cascache::util::DumpSegment::kBrief)
            && value <= static_cast<int32_t>(cascache::util::DumpSegment::kDetail)) {
        return true;
    } else {
        std::cout << "Invalid value for --" << flagname << ": " << value << std::endl;
        return false;
    }
}

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("Segment Dumper Utility for libcascache\n"
        "  Shows the header and tables of a live cache segment for debugging/trouble-shooting\n"
        "  Usage: cascache_dump_segment <flags> <meta file>\n"
        "  Example: cascache_dump_segment /tmp/cascache_segment\n"
        "  Example2: cascache_dump_segment --dump_keys --verbose=1 --limit -1 /tmp/my_cache"
    );
    gflags::RegisterFlagValidator(&FLAGS_verbose,       &ValidateVerbose);
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    cascache::util::DumpSegment dump;
    dump.verbose_       = static_cast<cascache::util::DumpSegment::Verbosity>(FLAGS_verbose);
    dump.limit_         = FLAGS_limit;
    dump.dump_keys_     = FLAGS_dump_keys;
    dump.dump_contents_ = FLAGS_dump_contents;

    if (argc != 2) {
        std::cerr << "Specify exactly one meta file" << std::endl;
        return 1;
    }

    std::string str(argv[1]);
    cascache::fs::Path path(str);
    if (!cascache::fs::exists(path)) {
        std::cerr << "File does not exist: " << str << " (" << path << ")" << std::endl;
        return 1;
    } else if (!cascache::fs::is_regular_file(path)) {
        std::cerr << "Not a regular file: " << str << " (" << path << ")" << std::endl;
        return 1;
    }
    dump.meta_path_ = str;

    FLAGS_stderrthreshold = 2;
    FLAGS_minloglevel = 3;
    google::InitGoogleLogging(argv[0]);
    int ret = dump.dump_to_stdout();
    google::ShutdownGoogleLogging();
    return ret;
}
