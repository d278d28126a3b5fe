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
 * Tracks a seek position over a stream of `length` bytes without holding any
 * data. Positions past the end are allowed and leave the length unchanged.
 * A seek that would produce a negative position fails and keeps the current
 * position.
 */
class FakeSeeker : public Seeker {
 public:
  explicit FakeSeeker(uint64_t length);

  Result<uint64_t> SeekSet(uint64_t offset) override;
  Result<uint64_t> SeekCur(int64_t offset) override;
  Result<uint64_t> SeekEnd(int64_t offset) override;

  uint64_t Length() const { return length_; }

 private:
  Result<uint64_t> SeekRelative(uint64_t base, int64_t offset);

  uint64_t seek_pos_ = 0;
  uint64_t length_;
};

}  // namespace seekext
