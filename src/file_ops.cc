/*
 *     Copyright 2024-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#include "internal.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>

#define SAVE_ERRNO_TO_ERRINFO(errinfo)  \
    do {                                \
        if (errinfo) {                  \
            (errinfo)->error = errno;   \
        }                               \
    } while (0)

static int handle_to_fd(wt_file_handle handle) {
    return static_cast<int>(reinterpret_cast<intptr_t>(handle));
}

static wt_file_handle fd_to_handle(int fd) {
    return reinterpret_cast<wt_file_handle>(static_cast<intptr_t>(fd));
}

class PosixFileOps : public FileOpsInterface {
public:
    wt_file_handle constructor(wtreader_error_info_t* errinfo) override;
    wtreader_error_t open(wtreader_error_info_t* errinfo,
                          wt_file_handle* handle,
                          const char* path,
                          int oflag) override;
    wtreader_error_t close(wtreader_error_info_t* errinfo,
                           wt_file_handle handle) override;
    ssize_t pread(wtreader_error_info_t* errinfo,
                  wt_file_handle handle,
                  void* buf,
                  size_t nbytes,
                  wt_off_t offset) override;
    wt_off_t goto_eof(wtreader_error_info_t* errinfo,
                      wt_file_handle handle) override;
    void destructor(wt_file_handle handle) override;
};

wt_file_handle PosixFileOps::constructor(wtreader_error_info_t*) {
    // We don't have a file descriptor until open() is called
    return fd_to_handle(-1);
}

wtreader_error_t PosixFileOps::open(wtreader_error_info_t* errinfo,
                                    wt_file_handle* handle,
                                    const char* path,
                                    int oflag) {
    int fd;
    do {
        fd = ::open(path, oflag | O_CLOEXEC);
    } while (fd == -1 && errno == EINTR);

    if (fd < 0) {
        SAVE_ERRNO_TO_ERRINFO(errinfo);
        if (errno == ENOENT) {
            return WTREADER_ERROR_NO_SUCH_FILE;
        }
        return WTREADER_ERROR_OPEN_FILE;
    }
    *handle = fd_to_handle(fd);
    return WTREADER_SUCCESS;
}

wtreader_error_t PosixFileOps::close(wtreader_error_info_t* errinfo,
                                     wt_file_handle handle) {
    const int fd = handle_to_fd(handle);
    if (fd == -1) {
        return WTREADER_SUCCESS;
    }
    if (::close(fd) < 0) {
        SAVE_ERRNO_TO_ERRINFO(errinfo);
        return WTREADER_ERROR_READ;
    }
    return WTREADER_SUCCESS;
}

ssize_t PosixFileOps::pread(wtreader_error_info_t* errinfo,
                            wt_file_handle handle,
                            void* buf,
                            size_t nbytes,
                            wt_off_t offset) {
    const int fd = handle_to_fd(handle);
    ssize_t rv;
    do {
        rv = ::pread(fd, buf, nbytes, offset);
    } while (rv == -1 && errno == EINTR);

    if (rv < 0) {
        SAVE_ERRNO_TO_ERRINFO(errinfo);
        return WTREADER_ERROR_READ;
    }
    return rv;
}

wt_off_t PosixFileOps::goto_eof(wtreader_error_info_t* errinfo,
                                wt_file_handle handle) {
    const int fd = handle_to_fd(handle);
    struct stat st;
    if (fstat(fd, &st) < 0) {
        SAVE_ERRNO_TO_ERRINFO(errinfo);
        return -1;
    }
    return wt_off_t(st.st_size);
}

void PosixFileOps::destructor(wt_file_handle) {
}

static PosixFileOps default_file_ops;

FileOpsInterface* wtreader_get_default_file_ops() {
    return &default_file_ops;
}
