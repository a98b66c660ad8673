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
#ifndef CASCACHE_UTIL_DUMP_SEGMENT_HPP_
#define CASCACHE_UTIL_DUMP_SEGMENT_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <vector>

#include "cascache/error_code.hpp"
#include "cascache/cache/cache_id.hpp"
#include "cascache/cache/fwd.hpp"

namespace cascache {
namespace util {

#define SEGMENT_INCONSISTENCIES \
    X(kInvalidHeader, "The header failed validation. Tables are not dumped.") \
    X(kBrokenKeyBlob, "Key slot refers to a blob that is not a valid key record.") \
    X(kBrokenContentBlob, "Content slot refers to a blob that is not a valid content record.") \
    X(kDanglingFingerprint, "Key slot refers to a fingerprint missing in the content table.") \
    X(kItemCountMismatch, "Item count in the header differs from the occupied key slots.") \
    X(kTooManyInconsistencies, "Too many inconsistencies found.")
/**
 * Represents one inconsistency found in a segment.
 */
struct SegmentInconsistency {
    enum InconsistencyType {
        kConsistent = 0,
#define X(a, b) /** b */ a,
SEGMENT_INCONSISTENCIES
#undef X
    };
    static const char* type_to_string(InconsistencyType type) {
        switch (type) {
            case kConsistent: return "kConsistent";
#define X_QUOTE(str) #str
#define X_EXPAND_AND_QUOTE(str) X_QUOTE(str)
#define X(a, b) case a: return X_EXPAND_AND_QUOTE(a);
SEGMENT_INCONSISTENCIES
#undef X
#undef X_EXPAND_AND_QUOTE
#undef X_QUOTE
            default:
                return "UNKNOWN";
        }
    }
    static const char* type_to_description(InconsistencyType type) {
        switch (type) {
            case kConsistent: return "not an error";
#define X(a, b) case a: return b;
SEGMENT_INCONSISTENCIES
#undef X
            default:
                return "UNKNOWN";
        }
    }
    SegmentInconsistency(
        InconsistencyType type = kConsistent,
        uint64_t slot = 0,
        ErrorCode error = kErrorCodeOk)
        : type_(type), slot_(slot), error_(error) {}

    /** Type of inconsistency. */
    InconsistencyType   type_;

    /** Slot in the key or content table, or 0 for header-level inconsistencies. */
    uint64_t            slot_;

    /** The error the segment accessor reported, if any. */
    ErrorCode           error_;

    friend std::ostream& operator<<(std::ostream& o, const SegmentInconsistency& v);
};

/**
 * @brief Segment Dumper Utility for libcascache.
 * @details
 * Attaches to a live segment by its meta file and prints it as XML.
 * This never takes the cache lock, which belongs to the application, so the output of a segment
 * that is being modified might be torn. It never modifies or destroys the segment either.
 */
struct DumpSegment {
    enum Verbosity {
        kBrief = 0,
        kNormal = 1,
        kDetail = 2,
    };

    DumpSegment() {
        verbose_ = kBrief;
        limit_ = -1;
        dump_keys_ = false;
        dump_contents_ = false;
        result_dumped_slots_ = 0;
        result_limit_reached_ = false;
    }

    Verbosity                           verbose_;
    /** Maximum number of slots to show in total. Negative means no limit. */
    int32_t                             limit_;
    bool                                dump_keys_;
    bool                                dump_contents_;
    std::string                         meta_path_;

    /** When this reaches limit_, we stop showing slots. */
    uint64_t                            result_dumped_slots_;
    /** Might become true only when limit_ is set. */
    bool                                result_limit_reached_;
    std::vector< SegmentInconsistency > result_inconsistencies_;

    /** main routine of cascache_dump_segment utility */
    int dump_to_stdout();

 private:
    void dump_key_table(cache::SegmentView* segment);
    void dump_content_table(cache::SegmentView* segment);
    /** Returns whether the slot should be shown, counting it against limit_. */
    bool consume_limit();
    void add_inconsistency(const SegmentInconsistency& inconsistency);
};

}  // namespace util
}  // namespace cascache

#endif  // CASCACHE_UTIL_DUMP_SEGMENT_HPP_
