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

#include "seekext/io/fake_seek.h"

#include <stdint.h>

#include <limits>

#include "seekext/result/expect.h"
#include "seekext/result/result_type.h"

namespace seekext {

FakeSeeker::FakeSeeker(uint64_t length) : seek_pos_(0), length_(length) {}

Result<uint64_t> FakeSeeker::SeekSet(const uint64_t offset) {
  return seek_pos_ = offset;
}

Result<uint64_t> FakeSeeker::SeekCur(const int64_t offset) {
  return SeekRelative(seek_pos_, offset);
}

Result<uint64_t> FakeSeeker::SeekEnd(const int64_t offset) {
  return SeekRelative(length_, offset);
}

Result<uint64_t> FakeSeeker::SeekRelative(const uint64_t base,
                                          const int64_t offset) {
  if (offset < 0 && static_cast<uint64_t>(-(offset + 1)) + 1 > base) {
    return SX_ERRF("Seek to {} + ({}) is before the start of the stream", base,
                   offset);
  }
  if (offset > 0 && static_cast<uint64_t>(offset) >
                        std::numeric_limits<uint64_t>::max() - base) {
    return SX_ERRF("Seek to {} + {} overflows the stream offset", base,
                   offset);
  }
  return seek_pos_ = base + static_cast<uint64_t>(offset);
}

}  // namespace seekext
