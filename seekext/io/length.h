//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <stdint.h>

#include "seekext/io/io.h"
#include "seekext/result/result_type.h"

namespace seekext {

/**
 * Returns the length in bytes of the stream behind `seeker`.
 *
 * Uses up to three seeks: the current position, the end of the stream, and a
 * seek back to the original position. The last one is skipped when the
 * stream was already positioned at its end.
 *
 * On success the seek position is the same as before the call. On failure
 * the error of the failing seek is returned unchanged, and the seek position
 * is undefined.
 *
 * Callers that only need the length of many streams and don't care about the
 * position can call `seeker.SeekEnd(0)` directly.
 */
Result<uint64_t> StreamLen(Seeker& seeker);

}  // namespace seekext
