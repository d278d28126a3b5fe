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

#include "seekext/io/length.h"

#include <stdint.h>

#include "seekext/io/io.h"
#include "seekext/io/position.h"
#include "seekext/result/result_type.h"

namespace seekext {

Result<uint64_t> StreamLen(Seeker& seeker) {
  Result<uint64_t> old_pos = StreamPosition(seeker);
  if (!old_pos.ok()) {
    return old_pos;
  }
  Result<uint64_t> len = seeker.SeekEnd(0);
  if (!len.ok()) {
    return len;
  }

  // Already at the end, a third seek would not move the cursor.
  if (*old_pos != *len) {
    Result<uint64_t> restored = seeker.SeekSet(*old_pos);
    if (!restored.ok()) {
      return restored;
    }
  }
  return len;
}

}  // namespace seekext
