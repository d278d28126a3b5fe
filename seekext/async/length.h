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

#include <string_view>
#include <variant>

#include "seekext/async/async_io.h"
#include "seekext/async/poll.h"
#include "seekext/async/position.h"

namespace seekext {

/**
 * Length query over a borrowed AsyncSeeker, driven by repeated calls to
 * `Poll`.
 *
 * Runs the same three steps as `StreamLen(Seeker&)`: read the current
 * position, seek to the end, seek back to the position read in the first step
 * unless it already was the end. Each step may leave the future pending. A
 * later poll continues the step that was pending and never repeats a step
 * that already completed.
 *
 * A failing step ends the query with the AsyncSeeker's error unchanged, and
 * leaves the seek position undefined. Destroying the future before it
 * completes leaves the position wherever the last completed step put it.
 */
class StreamLenFuture {
 public:
  using Output = uint64_t;

  explicit StreamLenFuture(AsyncSeeker& seeker);

  StreamLenFuture(const StreamLenFuture&) = delete;
  StreamLenFuture(StreamLenFuture&&) = default;
  StreamLenFuture& operator=(const StreamLenFuture&) = delete;
  StreamLenFuture& operator=(StreamLenFuture&&) = default;

  // Must not be called again after returning a result.
  PollResult<uint64_t> Poll(const Waker& waker);

  std::string_view StateName() const;

 private:
  struct AwaitingPosition {
    StreamPositionFuture position;
  };
  struct AwaitingEndSeek {
    uint64_t old_pos;
  };
  struct AwaitingRestoreSeek {
    uint64_t old_pos;
    uint64_t len;
  };
  struct Done {};

  AsyncSeeker* seeker_;
  std::variant<AwaitingPosition, AwaitingEndSeek, AwaitingRestoreSeek, Done>
      state_;
};

// Returns the length of the stream once polled to completion. The AsyncSeeker
// must outlive the returned future and must not be used for anything else
// until the future completes or is destroyed.
[[nodiscard]] StreamLenFuture AsyncStreamLen(AsyncSeeker& seeker);

}  // namespace seekext
