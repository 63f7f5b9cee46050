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

/**
 * Abstract file handle and operations interface.
 *
 * All file access goes through an implementation of this interface so that
 * tests may inject failures or count reads. The reader never writes, so
 * only the read side of the interface exists.
 */
class FileOpsInterface {
public:
    virtual ~FileOpsInterface() = default;

    /**
     * Initialize state (e.g. allocate memory) for a file handle
     * before opening a file. This method is optional and
     * doesn't need to do anything at all; it can just return nullptr
     * if there isn't anything to initialize.
     *
     * @param errinfo Pointer to a wtreader_error_info_t where the OS error
     *                will be stored if the call fails
     * @return a handle to use in subsequent calls
     */
    virtual wt_file_handle constructor(wtreader_error_info_t* errinfo) = 0;

    /**
     * Open a file.
     *
     * @param errinfo Pointer to a wtreader_error_info_t
     * @param handle On input, a pointer to the handle that was returned
     *               by constructor(). The handle may be replaced by the
     *               implementation.
     * @param path The name of the file
     * @param oflag Flags as normally passed to open(2)
     * @return WTREADER_SUCCESS upon success
     */
    virtual wtreader_error_t open(wtreader_error_info_t* errinfo,
                                  wt_file_handle* handle,
                                  const char* path,
                                  int oflag) = 0;

    /**
     * Close a file.
     *
     * @return WTREADER_SUCCESS upon success, WTREADER_ERROR_READ
     *         (with the OS error in errinfo) otherwise
     */
    virtual wtreader_error_t close(wtreader_error_info_t* errinfo,
                                   wt_file_handle handle) = 0;

    /**
     * Read a chunk of data from a given offset in the file.
     *
     * @param errinfo Pointer to a wtreader_error_info_t
     * @param handle file handle to read from
     * @param buf where to store data
     * @param nbytes number of bytes to read
     * @param offset where to read from
     * @return number of bytes read (which may be less than nbytes),
     *         or a value <= 0 if an error occurred
     */
    virtual ssize_t pread(wtreader_error_info_t* errinfo,
                          wt_file_handle handle,
                          void* buf,
                          size_t nbytes,
                          wt_off_t offset) = 0;

    /**
     * Find the end of the file.
     *
     * @return the offset (from beginning of the file), or -1 if
     *         the operation failed
     */
    virtual wt_off_t goto_eof(wtreader_error_info_t* errinfo,
                              wt_file_handle handle) = 0;

    /**
     * Called as part of shutting down the handle to allow the
     * implementation to release any resources allocated by constructor()
     */
    virtual void destructor(wt_file_handle handle) = 0;
};

/**
 * Get the default FileOpsInterface object (plain POSIX pread on a
 * read-only file descriptor)
 */
LIBWTREADER_API
FileOpsInterface* wtreader_get_default_file_ops();
