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

#include "seekext/async/async_io.h"
#include "seekext/async/poll.h"

namespace seekext {

// Pending `SeekCur(0)` on a borrowed AsyncSeeker.
class StreamPositionFuture {
 public:
  using Output = uint64_t;

  explicit StreamPositionFuture(AsyncSeeker& seeker);

  StreamPositionFuture(const StreamPositionFuture&) = delete;
  StreamPositionFuture(StreamPositionFuture&&) = default;
  StreamPositionFuture& operator=(const StreamPositionFuture&) = delete;
  StreamPositionFuture& operator=(StreamPositionFuture&&) = default;

  // Must not be called again after returning a result.
  PollResult<uint64_t> Poll(const Waker& waker);

 private:
  AsyncSeeker* seeker_;
  bool done_ = false;
};

// Returns the current offset from the start of the stream once polled to
// completion. The AsyncSeeker must outlive the returned future.
[[nodiscard]] StreamPositionFuture AsyncStreamPosition(AsyncSeeker& seeker);

}  // namespace seekext
