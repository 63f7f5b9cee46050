/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#pragma once

#ifndef WTREADER_WT_READER_H
#error "You should include <libwtreader/wt_reader.h> instead"
#endif

/** Error values returned by wtreader API calls. */
enum wtreader_error_t {
    WTREADER_SUCCESS = 0,
    WTREADER_ERROR_OPEN_FILE = -1,
    WTREADER_ERROR_CORRUPT = -2,
    WTREADER_ERROR_ALLOC_FAIL = -3,
    WTREADER_ERROR_READ = -4,

    /**
     * Returned by CollectionCursor::next() once the cursor is exhausted
     * (or the requested limit is reached), and by findRecord() when the
     * record id isn't present in the collection.
     */
    WTREADER_ERROR_NOT_FOUND = -5,

    /** Neither WiredTiger.turtle nor WiredTiger.turtle.set exist */
    WTREADER_ERROR_NO_BOOTSTRAP = -6,
    WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION = -7,

    /** The block checksum or size doesn't match its address cookie */
    WTREADER_ERROR_CHECKSUM_FAIL = -8,
    WTREADER_ERROR_INVALID_ARGUMENTS = -9,
    WTREADER_ERROR_NO_SUCH_FILE = -10,
    WTREADER_ERROR_CANCEL = -11,

    /** A block address points beyond the end of the file */
    WTREADER_ERROR_TRUNCATED_FILE = -12,
    WTREADER_ERROR_UNSUPPORTED_PAGE_TYPE = -13,
    WTREADER_ERROR_DECOMPRESSION_MISMATCH = -14,
    WTREADER_ERROR_CELL_COUNT_MISMATCH = -15,
    WTREADER_ERROR_MALFORMED_VARINT = -16,

    /** A page was reached twice during one traversal */
    WTREADER_ERROR_CORRUPT_TREE = -17,
    WTREADER_ERROR_UNKNOWN_FIELD_TYPE = -18,
    WTREADER_ERROR_NO_SUCH_COLLECTION = -19,
    WTREADER_ERROR_ENCRYPTED = -20,
    WTREADER_ERROR_NOT_SUPPORTED = -21
};
