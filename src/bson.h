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

#include "internal.h"

#include <string_view>

// Nesting deeper than this is treated as corruption
#define BSON_MAX_DEPTH 100
#define BSON_MIN_DOCUMENT_SIZE 5

namespace wtreader {

/**
 * Decode a BSON document. The document length must match the size of the
 * buffer exactly.
 *
 * @throws Exception(WTREADER_ERROR_UNKNOWN_FIELD_TYPE) for element types
 *         we don't handle (including the deprecated DBPointer and code
 *         with scope), Exception(WTREADER_ERROR_CORRUPT) for structural
 *         damage
 */
Document decode_bson(std::string_view bytes);

} // namespace wtreader
