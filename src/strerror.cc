/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#include <libwtreader/wt_reader.h>

const char* wtreader_strerror(wtreader_error_t errcode) {
    switch (errcode) {
    case WTREADER_SUCCESS:
        return "success";
    case WTREADER_ERROR_OPEN_FILE:
        return "error opening file";
    case WTREADER_ERROR_CORRUPT:
        return "malformed data in file";
    case WTREADER_ERROR_ALLOC_FAIL:
        return "failed to allocate buffer";
    case WTREADER_ERROR_READ:
        return "error reading file";
    case WTREADER_ERROR_NOT_FOUND:
        return "not found";
    case WTREADER_ERROR_NO_BOOTSTRAP:
        return "no WiredTiger.turtle in data directory";
    case WTREADER_ERROR_UNSUPPORTED_FORMAT_VERSION:
        return "unsupported format version";
    case WTREADER_ERROR_CHECKSUM_FAIL:
        return "checksum fail";
    case WTREADER_ERROR_INVALID_ARGUMENTS:
        return "invalid arguments";
    case WTREADER_ERROR_NO_SUCH_FILE:
        return "no such file";
    case WTREADER_ERROR_CANCEL:
        return "error cancel";
    case WTREADER_ERROR_TRUNCATED_FILE:
        return "block address beyond end of file";
    case WTREADER_ERROR_UNSUPPORTED_PAGE_TYPE:
        return "unsupported page type";
    case WTREADER_ERROR_DECOMPRESSION_MISMATCH:
        return "decompressed size mismatch";
    case WTREADER_ERROR_CELL_COUNT_MISMATCH:
        return "cell count mismatch";
    case WTREADER_ERROR_MALFORMED_VARINT:
        return "malformed packed integer";
    case WTREADER_ERROR_CORRUPT_TREE:
        return "corrupt b-tree structure";
    case WTREADER_ERROR_UNKNOWN_FIELD_TYPE:
        return "unknown BSON field type";
    case WTREADER_ERROR_NO_SUCH_COLLECTION:
        return "no such collection";
    case WTREADER_ERROR_ENCRYPTED:
        return "page is encrypted";
    case WTREADER_ERROR_NOT_SUPPORTED:
        return "not supported";
    }
    return "wtreader_strerror unknown errcode";
}
