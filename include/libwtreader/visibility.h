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

#if defined(LIBWTREADER_INTERNAL)

#ifdef __SUNPRO_C
#define LIBWTREADER_API __global
#elif defined(HAVE_VISIBILITY) && HAVE_VISIBILITY
#define LIBWTREADER_API __attribute__((visibility("default")))
#elif defined(_MSC_VER)
#define LIBWTREADER_API extern __declspec(dllexport)
#else
#define LIBWTREADER_API
#endif

#else

#if defined(_MSC_VER) && !defined(LIBWTREADER_NO_VISIBILITY)
#define LIBWTREADER_API extern __declspec(dllimport)
#else
#define LIBWTREADER_API
#endif

#endif
